#include "txn/transaction_context.hpp"

#include <utility>

#include <fmt/format.h>

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"

namespace kanbanhub::txn
{

std::string_view to_string(OperationStatus status) noexcept
{
    switch (status)
    {
    case OperationStatus::Pending:
        return "pending";
    case OperationStatus::Completed:
        return "completed";
    case OperationStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::string_view to_string(TransactionState state) noexcept
{
    switch (state)
    {
    case TransactionState::Pending:
        return "pending";
    case TransactionState::Running:
        return "running";
    case TransactionState::Committing:
        return "committing";
    case TransactionState::Failing:
        return "failing";
    case TransactionState::TimedOut:
        return "timed_out";
    case TransactionState::RollingBack:
        return "rolling_back";
    case TransactionState::Closed:
        return "closed";
    }
    return "unknown";
}

void to_json(nlohmann::json &j, const OperationRecord &record)
{
    j = nlohmann::json{{"service", record.service_name},
                       {"method", record.method_name},
                       {"timestamp", format_tools::iso8601(record.timestamp)},
                       {"status", std::string(to_string(record.status))}};
}

TransactionContext::TransactionContext(std::string id, nlohmann::json metadata,
                                       std::optional<std::chrono::milliseconds> timeout)
    : m_id(std::move(id)), m_start_time(std::chrono::system_clock::now()),
      m_deadline(timeout ? std::optional<std::chrono::system_clock::time_point>(
                               std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                                   m_start_time + *timeout))
                         : std::nullopt),
      m_metadata(metadata.is_object() ? std::move(metadata) : nlohmann::json::object())
{
}

TransactionState TransactionContext::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void TransactionContext::set_state(TransactionState state)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = state;
}

bool TransactionContext::is_active() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == TransactionState::Pending || m_state == TransactionState::Running;
}

void TransactionContext::require_active_(std::string_view what) const
{
    if (m_state != TransactionState::Pending && m_state != TransactionState::Running)
    {
        throw ValidationError(
            fmt::format("Cannot {} transaction {}: it is {}", what, m_id, to_string(m_state)));
    }
}

void TransactionContext::add_operation(std::string service_name, std::string method_name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    require_active_("add an operation to");
    m_operations.push_back(OperationRecord{.service_name = std::move(service_name),
                                           .method_name = std::move(method_name),
                                           .timestamp = std::chrono::system_clock::now(),
                                           .status = OperationStatus::Pending});
}

void TransactionContext::add_rollback_action(RollbackAction action)
{
    if (!action)
        throw ValidationError(fmt::format("Empty rollback action for transaction {}", m_id));
    std::lock_guard<std::mutex> lock(m_mutex);
    require_active_("add a rollback action to");
    m_rollback_actions.push_back(std::move(action));
}

void TransactionContext::settle_operations(OperationStatus status)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &op : m_operations)
    {
        if (op.status == OperationStatus::Pending)
            op.status = status;
    }
}

std::vector<OperationRecord> TransactionContext::operations() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_operations;
}

std::size_t TransactionContext::operation_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_operations.size();
}

std::size_t TransactionContext::rollback_action_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rollback_actions.size();
}

std::vector<RollbackAction> TransactionContext::take_rollback_actions()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::exchange(m_rollback_actions, {});
}

nlohmann::json TransactionContext::metadata() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_metadata;
}

void TransactionContext::set_metadata(const std::string &key, nlohmann::json value)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metadata[key] = std::move(value);
}

TransactionInfo TransactionContext::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return TransactionInfo{.id = m_id,
                           .start_time = m_start_time,
                           .state = m_state,
                           .operations = m_operations,
                           .rollback_action_count = m_rollback_actions.size(),
                           .metadata = m_metadata,
                           .deadline = m_deadline};
}

} // namespace kanbanhub::txn
