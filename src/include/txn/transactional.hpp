#pragma once
/**
 * @file transactional.hpp
 * @brief Wraps callables so they run inside a managed transaction unless the caller
 *        already supplies one.
 *
 * @code
 *   auto decorator = create_transaction_decorator(coordinator);
 *   auto archive = decorator.wrap(service, &ArchiveService::archive);
 *
 *   archive("task-1");          // opens a transaction, calls archive("task-1", ctx)
 *   archive("task-1", ctx);     // already inside one: called as is
 * @endcode
 *
 * Only the direct last argument is inspected: it has to be an lvalue
 * TransactionContext. A context nested inside another argument is not seen, and the
 * call opens a new transaction.
 *
 * When a transaction is opened, the arguments are copied (or moved) into it the way
 * std::thread takes them, so an abandoned timed-out call never reads the caller's
 * frame. Pass std::ref(x) to hand the callable a reference to the caller's object.
 */
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "txn/service_coordinator.hpp"
#include "txn/transaction_context.hpp"
#include "txn/transaction_options.hpp"

namespace kanbanhub::txn
{

namespace detail
{

template <typename... Args> struct last_is_context : std::false_type
{
};

template <typename Last>
struct last_is_context<Last>
    : std::bool_constant<std::is_lvalue_reference_v<Last> &&
                         std::is_same_v<std::remove_cvref_t<Last>, TransactionContext> &&
                         !std::is_const_v<std::remove_reference_t<Last>>>
{
};

template <typename First, typename Second, typename... Rest>
struct last_is_context<First, Second, Rest...> : last_is_context<Second, Rest...>
{
};

template <typename... Args> inline constexpr bool last_is_context_v = last_is_context<Args...>::value;

} // namespace detail

template <typename Fn> class Transactional
{
  public:
    Transactional(ServiceTransactionCoordinator &coordinator, Fn fn, TransactionOptions options)
        : m_coordinator(coordinator), m_fn(std::move(fn)), m_options(std::move(options))
    {
    }

    template <typename... Args> decltype(auto) operator()(Args &&...args)
    {
        if constexpr (detail::last_is_context_v<Args &&...>)
        {
            return std::invoke(m_fn, std::forward<Args>(args)...);
        }
        else
        {
            return m_coordinator.run_in_transaction(
                [fn = m_fn, stored = std::tuple<std::decay_t<Args>...>(std::forward<Args>(args)...)](
                    TransactionContext &context) mutable -> decltype(auto)
                {
                    return std::apply([&fn, &context](auto &...a) -> decltype(auto)
                                      { return std::invoke(fn, std::move(a)..., context); },
                                      stored);
                },
                m_options);
        }
    }

    const TransactionOptions &options() const noexcept { return m_options; }

  private:
    ServiceTransactionCoordinator &m_coordinator;
    Fn m_fn;
    TransactionOptions m_options;
};

class TransactionDecorator
{
  public:
    explicit TransactionDecorator(ServiceTransactionCoordinator &coordinator, TransactionOptions options = {})
        : m_coordinator(coordinator), m_options(std::move(options))
    {
    }

    template <typename Fn> auto wrap(Fn fn) const
    {
        return Transactional<Fn>(m_coordinator, std::move(fn), m_options);
    }

    /// Binds @p object as the receiver of @p method; @p object must outlive the wrapper.
    template <typename Obj, typename Method> auto wrap(Obj &object, Method method) const
    {
        auto bound = [&object, method](auto &&...args) -> decltype(auto)
        { return std::invoke(method, object, std::forward<decltype(args)>(args)...); };
        return Transactional<decltype(bound)>(m_coordinator, std::move(bound), m_options);
    }

  private:
    ServiceTransactionCoordinator &m_coordinator;
    TransactionOptions m_options;
};

inline TransactionDecorator create_transaction_decorator(ServiceTransactionCoordinator &coordinator,
                                                         TransactionOptions options = {})
{
    return TransactionDecorator(coordinator, std::move(options));
}

} // namespace kanbanhub::txn
