#include "txn/transaction_manager.hpp"

#include <future>
#include <thread>

#include "utils/backoff_strategy.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::txn
{

namespace
{

long long elapsed_ms(std::chrono::steady_clock::time_point since)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since)
        .count();
}

} // namespace

TransactionManager::TransactionManager(store::Store &store, Backoff backoff)
    : m_store(store), m_backoff(backoff ? std::move(backoff) : Backoff(utils::RetryBackoff{}))
{
}

TransactionManager::~TransactionManager()
{
    const auto remaining = m_registry.size();
    if (remaining > 0)
    {
        LOGGER_WARN("TransactionManager: destroyed with {} transactions still registered", remaining);
    }
}

void TransactionManager::set_retry_backoff(Backoff backoff)
{
    std::lock_guard<std::mutex> lock(m_backoff_mutex);
    m_backoff = backoff ? std::move(backoff) : Backoff(utils::RetryBackoff{});
}

void TransactionManager::add_operation(TransactionContext &context, std::string service_name,
                                       std::string method_name)
{
    LOGGER_TRACE("TransactionManager: {} records {}.{}", context.id(), service_name, method_name);
    context.add_operation(std::move(service_name), std::move(method_name));
}

void TransactionManager::add_rollback_action(TransactionContext &context, RollbackAction action)
{
    context.add_rollback_action(std::move(action));
}

std::size_t TransactionManager::active_transaction_count() const
{
    return m_registry.size();
}

std::optional<TransactionInfo> TransactionManager::get_transaction(const std::string &id) const
{
    return m_registry.find(id);
}

std::vector<TransactionInfo> TransactionManager::get_active_transactions() const
{
    return m_registry.snapshot();
}

std::size_t TransactionManager::active_operation_count() const
{
    return m_registry.total_operations();
}

void TransactionManager::run_(Work work, const TransactionOptions &options)
{
    auto shared_work = std::make_shared<Work>(std::move(work));
    auto context = std::make_shared<TransactionContext>(uid::generate_transaction_id(),
                                                        nlohmann::json{{"options", options}}, options.timeout);
    m_registry.insert(context);
    auto evict = basics::make_scope_guard(
        [this, &context]() noexcept
        {
            context->set_state(TransactionState::Closed);
            m_registry.erase(context->id());
        });

    const auto started = std::chrono::steady_clock::now();
    LOGGER_INFO("TransactionManager: starting {} (isolation={}, timeout={}ms, auto_rollback={})", context->id(),
                options.isolation_level ? to_string(*options.isolation_level) : "default",
                options.timeout ? options.timeout->count() : 0, options.auto_rollback);

    try
    {
        m_store.transaction(
            [&]()
            {
                context->set_state(TransactionState::Running);
                if (options.isolation_level)
                {
                    if (auto directive = isolation_directive(*options.isolation_level))
                        m_store.exec(*directive);
                }
                if (options.timeout)
                    run_with_deadline_(shared_work, context, *options.timeout);
                else
                    (*shared_work)(*context);
                context->set_state(TransactionState::Committing);
            });
    }
    catch (const std::exception &e)
    {
        fail_(*context, options, started, e.what());
    }
    catch (...)
    {
        fail_(*context, options, started, "non-standard exception");
    }

    context->settle_operations(OperationStatus::Completed);
    LOGGER_INFO("TransactionManager: {} committed in {}ms ({} operations)", context->id(), elapsed_ms(started),
                context->operation_count());
}

void TransactionManager::run_with_deadline_(const std::shared_ptr<Work> &work,
                                            const std::shared_ptr<TransactionContext> &context,
                                            std::chrono::milliseconds timeout)
{
    // The worker holds its own shares of the work and the context: if we stop waiting,
    // it can still finish safely.
    auto task = std::make_shared<std::packaged_task<void()>>([work, context]() { (*work)(*context); });
    auto done = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (done.wait_for(timeout) == std::future_status::timeout)
    {
        context->set_state(TransactionState::TimedOut);
        LOGGER_WARN("TransactionManager: {} exceeded its {}ms deadline; abandoning the work", context->id(),
                    timeout.count());
        throw TransactionTimeoutError(context->id(), timeout);
    }
    done.get();
}

void TransactionManager::fail_(TransactionContext &context, const TransactionOptions &options,
                               std::chrono::steady_clock::time_point started, const std::string &message)
{
    auto cause = std::current_exception();
    const bool timed_out = context.state() == TransactionState::TimedOut;
    if (!timed_out)
        context.set_state(TransactionState::Failing);
    context.settle_operations(OperationStatus::Failed);

    auto operations = context.operations();
    LOGGER_ERROR("TransactionManager: {} failed after {}ms ({} operations): {}", context.id(), elapsed_ms(started),
                 operations.size(), message);

    if (options.auto_rollback)
    {
        context.set_state(TransactionState::RollingBack);
        rollback_(context);
    }
    throw TransactionFailure(context.id(), message, std::move(operations), std::move(cause), timed_out);
}

void TransactionManager::rollback_(TransactionContext &context)
{
    auto actions = context.take_rollback_actions();
    LOGGER_INFO("TransactionManager: rolling back {} ({} actions)", context.id(), actions.size());

    for (std::size_t i = actions.size(); i-- > 0;)
    {
        try
        {
            actions[i]();
        }
        catch (const std::exception &e)
        {
            const RollbackActionError error(context.id(), i, e.what());
            LOGGER_ERROR("TransactionManager: {}", error.what());
        }
        catch (...)
        {
            const RollbackActionError error(context.id(), i, "non-standard exception");
            LOGGER_ERROR("TransactionManager: {}", error.what());
        }
    }
}

void TransactionManager::before_retry_(int attempt, int max_attempts, const TransactionFailure &failure)
{
    Backoff backoff;
    {
        std::lock_guard<std::mutex> lock(m_backoff_mutex);
        backoff = m_backoff;
    }
    LOGGER_INFO("TransactionManager: retrying after attempt {}/{} of {}: {}", attempt, max_attempts,
                failure.transaction_id(), failure.what());
    backoff(attempt);
}

} // namespace kanbanhub::txn
