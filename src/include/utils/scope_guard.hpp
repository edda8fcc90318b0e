#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace kanbanhub::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs whether the scope is left by normal execution or by an
 * exception. The guard is movable but not copyable, enforcing unique ownership of
 * the cleanup action.
 *
 * The callable must be `noexcept`-invocable: the destructor runs during stack
 * unwinding, and a cleanup that can fail has to report the failure itself (e.g. by
 * logging) rather than throw. This is checked at compile time.
 *
 * ### Usage Example
 *
 * @code
 *  void run_transaction(TransactionRegistry &registry, std::shared_ptr<Ctx> ctx) {
 *      registry.insert(ctx);
 *      // Evict the context on every exit path.
 *      auto evict = kanbanhub::basics::make_scope_guard([&]() noexcept {
 *          registry.erase(ctx->id());
 *      });
 *      do_work(*ctx);   // may throw
 *  }                    // `evict` runs here
 * @endcode
 *
 * ### Thread Safety
 *
 * Not thread-safe. A single guard must not be shared between threads.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept; report cleanup failures inside it.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    /// Transfers the cleanup action; the source guard is dismissed.
    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @return `true` if the guard will still execute on scope exit.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Deactivates the guard; the callable will not run.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the callable now (if still active) and dismisses the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss first so the destructor cannot run it twice
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard; the callable is always stored by value.
 *
 * @note Ensure that any references captured by @p f remain valid until the guard
 *       executes.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace kanbanhub::basics
