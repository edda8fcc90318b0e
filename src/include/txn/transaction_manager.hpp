#pragma once
/**
 * @file transaction_manager.hpp
 * @brief Runs work inside one store transaction with saga-style compensation.
 *
 * ## One call
 *
 *  1. A TransactionContext with a fresh "tx-" id is created and registered.
 *  2. Store::transaction() is opened; the isolation directive, if any, is issued.
 *  3. The work runs with the context. It records operations and registers
 *     compensations through add_operation() / add_rollback_action().
 *  4. Success: the store commits, pending operations become completed, the result is
 *     returned.
 *     Failure: the store rolls back, then (with auto_rollback) every registered
 *     compensation runs in reverse order, and the work's error is thrown wrapped in a
 *     TransactionFailure.
 *  5. The context is evicted from the registry on every path.
 *
 * ## Timeouts
 *
 * With options.timeout the work runs on a detached thread and the manager waits for at
 * most the timeout. On expiry the transaction fails as above with a
 * TransactionTimeoutError cause. The work itself cannot be cancelled: it keeps
 * running, owns a share of its closure and the context, and its outcome is ignored.
 * The context is closed by then, so the abandoned work's next add_operation() or
 * add_rollback_action() throws and a coordinated saga stops at its next step. Work
 * that may be abandoned must own what it touches; execute_transaction() keeps its
 * closure alive, and batch_in_transaction() and Transactional copy their inputs into it.
 *
 * ## Thread safety
 *
 * All public members may be called concurrently. The store serialises the
 * transactions themselves.
 */
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "store/store.hpp"
#include "txn/error_classifier.hpp"
#include "txn/transaction_context.hpp"
#include "txn/transaction_failure.hpp"
#include "txn/transaction_options.hpp"
#include "txn/transaction_registry.hpp"

namespace kanbanhub::txn
{

class TransactionManager
{
  public:
    using Work = std::function<void(TransactionContext &)>;
    /// Called with the 1-based number of the attempt that just failed; blocks for the delay.
    using Backoff = std::function<void(int)>;

    explicit TransactionManager(store::Store &store, Backoff backoff = {});
    ~TransactionManager();

    TransactionManager(const TransactionManager &) = delete;
    TransactionManager &operator=(const TransactionManager &) = delete;

    /**
     * @brief Runs @p work in a new transaction and returns its result.
     *
     * @p work is invoked as `work(TransactionContext &)`; it must be copyable. A `void`
     * result is supported.
     * @throws TransactionFailure wrapping whatever the work (or the store) threw, or a
     *         TransactionTimeoutError when the deadline fired.
     */
    template <typename F, typename R = std::remove_cvref_t<std::invoke_result_t<F &, TransactionContext &>>>
    R execute_transaction(F &&work, const TransactionOptions &options = {});

    /**
     * @brief execute_transaction() up to `options.retry_attempts + 1` times.
     *
     * Only a failure whose cause ErrorClassifier deems transient is retried; any other
     * failure, and the last transient one, propagates. Every attempt is a new
     * transaction with a new context. The retry backoff runs between attempts.
     */
    template <typename F, typename R = std::remove_cvref_t<std::invoke_result_t<F &, TransactionContext &>>>
    R execute_transaction_with_retry(F &&work, const TransactionOptions &options = {});

    /**
     * @brief Runs @p operation over @p items in consecutive transactions of at most
     *        @p batch_size items each, returning the results in item order.
     *
     * A failing batch throws; batches committed before it stay committed. Each batch
     * owns a copy of its items and shares @p operation, so an abandoned batch never
     * reads the caller's frame.
     */
    template <typename T, typename Op>
    auto batch_in_transaction(const std::vector<T> &items, Op operation, std::size_t batch_size = 100,
                              const TransactionOptions &options = {})
        -> std::vector<std::remove_cvref_t<std::invoke_result_t<Op &, const T &, std::size_t>>>;

    /// Appends a pending OperationRecord. @throws ValidationError if the context is closed.
    void add_operation(TransactionContext &context, std::string service_name, std::string method_name);

    /// Registers a compensation. @throws ValidationError if the context is closed.
    void add_rollback_action(TransactionContext &context, RollbackAction action);

    std::size_t active_transaction_count() const;
    std::optional<TransactionInfo> get_transaction(const std::string &id) const;
    std::vector<TransactionInfo> get_active_transactions() const;
    std::size_t active_operation_count() const;

    void set_retry_backoff(Backoff backoff);

  private:
    void run_(Work work, const TransactionOptions &options);
    void run_with_deadline_(const std::shared_ptr<Work> &work, const std::shared_ptr<TransactionContext> &context,
                            std::chrono::milliseconds timeout);
    [[noreturn]] void fail_(TransactionContext &context, const TransactionOptions &options,
                            std::chrono::steady_clock::time_point started, const std::string &message);
    void rollback_(TransactionContext &context);
    void before_retry_(int attempt, int max_attempts, const TransactionFailure &failure);

    store::Store &m_store;
    TransactionRegistry m_registry;
    Backoff m_backoff;
    mutable std::mutex m_backoff_mutex;
};

// ---------------------------------------------------------------------------
// Template implementations
// ---------------------------------------------------------------------------

template <typename F, typename R>
R TransactionManager::execute_transaction(F &&work, const TransactionOptions &options)
{
    if constexpr (std::is_void_v<R>)
    {
        run_(Work(std::forward<F>(work)), options);
    }
    else
    {
        // Shared with the closure so an abandoned worker never writes into a dead frame.
        auto result = std::make_shared<std::optional<R>>();
        run_(
            [result, fn = std::forward<F>(work)](TransactionContext &ctx) mutable
            { result->emplace(std::invoke(fn, ctx)); },
            options);
        return std::move(**result);
    }
}

template <typename F, typename R>
R TransactionManager::execute_transaction_with_retry(F &&work, const TransactionOptions &options)
{
    const int max_attempts = std::max(options.retry_attempts, 0) + 1;
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return execute_transaction(work, options);
        }
        catch (const TransactionFailure &failure)
        {
            if (attempt >= max_attempts || !ErrorClassifier::is_transient(failure))
                throw;
            before_retry_(attempt, max_attempts, failure);
        }
    }
}

template <typename T, typename Op>
auto TransactionManager::batch_in_transaction(const std::vector<T> &items, Op operation, std::size_t batch_size,
                                              const TransactionOptions &options)
    -> std::vector<std::remove_cvref_t<std::invoke_result_t<Op &, const T &, std::size_t>>>
{
    using Result = std::remove_cvref_t<std::invoke_result_t<Op &, const T &, std::size_t>>;
    if (batch_size == 0)
        batch_size = 1;

    auto shared_operation = std::make_shared<Op>(std::move(operation));
    std::vector<Result> results;
    results.reserve(items.size());
    for (std::size_t begin = 0; begin < items.size(); begin += batch_size)
    {
        const std::size_t end = std::min(items.size(), begin + batch_size);
        std::vector<T> chunk(items.begin() + static_cast<std::ptrdiff_t>(begin),
                             items.begin() + static_cast<std::ptrdiff_t>(end));
        auto batch = execute_transaction(
            [shared_operation, begin, chunk = std::move(chunk)](TransactionContext &)
            {
                std::vector<Result> out;
                out.reserve(chunk.size());
                for (std::size_t k = 0; k < chunk.size(); ++k)
                    out.push_back(std::invoke(*shared_operation, chunk[k], begin + k));
                return out;
            },
            options);
        for (auto &r : batch)
            results.push_back(std::move(r));
    }
    return results;
}

} // namespace kanbanhub::txn
