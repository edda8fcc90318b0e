#pragma once
/**
 * @file transaction_context.hpp
 * @brief Per-transaction state: audit trail, compensations, metadata and lifecycle.
 *
 * A context is created by the TransactionManager for one execute_transaction call,
 * lives in the registry while the store transaction is open, and is discarded after.
 * It is shared-owned: a timed-out work function abandoned on its worker thread may
 * still hold it, so every member is guarded by the context's own mutex.
 *
 * ## Lifecycle
 *
 * @code
 *   Pending -> Running -> Committing -> Closed
 *              Running -> Failing  -> RollingBack -> Closed
 *              Running -> TimedOut -> RollingBack -> Closed
 * @endcode
 *
 * With auto_rollback off, Failing / TimedOut go straight to Closed. Operations and
 * compensations can only be added while Pending or Running.
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace kanbanhub::txn
{

enum class OperationStatus
{
    Pending,
    Completed,
    Failed
};

enum class TransactionState
{
    Pending,
    Running,
    Committing,
    Failing,
    TimedOut,
    RollingBack,
    Closed
};

std::string_view to_string(OperationStatus status) noexcept;
std::string_view to_string(TransactionState state) noexcept;

/// One step of a saga, kept for auditing only.
struct OperationRecord
{
    std::string service_name;
    std::string method_name;
    std::chrono::system_clock::time_point timestamp;
    OperationStatus status = OperationStatus::Pending;
};

/// Undoes one operation. Must tolerate the operation's effect being absent or partial.
using RollbackAction = std::function<void()>;

/// A copy of a live context, returned by introspection.
struct TransactionInfo
{
    std::string id;
    std::chrono::system_clock::time_point start_time;
    TransactionState state = TransactionState::Pending;
    std::vector<OperationRecord> operations;
    std::size_t rollback_action_count = 0;
    nlohmann::json metadata;
    std::optional<std::chrono::system_clock::time_point> deadline;
};

void to_json(nlohmann::json &j, const OperationRecord &record);

class TransactionContext
{
  public:
    TransactionContext(std::string id, nlohmann::json metadata,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    TransactionContext(const TransactionContext &) = delete;
    TransactionContext &operator=(const TransactionContext &) = delete;

    const std::string &id() const noexcept { return m_id; }
    std::chrono::system_clock::time_point start_time() const noexcept { return m_start_time; }
    const std::optional<std::chrono::system_clock::time_point> &deadline() const noexcept { return m_deadline; }

    TransactionState state() const;
    void set_state(TransactionState state);

    /// True while operations and compensations may still be added.
    bool is_active() const;

    /// @throws ValidationError once the context has left Pending / Running.
    void add_operation(std::string service_name, std::string method_name);

    /// @throws ValidationError once the context has left Pending / Running.
    void add_rollback_action(RollbackAction action);

    /// Every operation still Pending becomes @p status.
    void settle_operations(OperationStatus status);

    std::vector<OperationRecord> operations() const;
    std::size_t operation_count() const;
    std::size_t rollback_action_count() const;

    /// Moves the registered compensations out, in registration order.
    std::vector<RollbackAction> take_rollback_actions();

    nlohmann::json metadata() const;
    void set_metadata(const std::string &key, nlohmann::json value);

    TransactionInfo snapshot() const;

  private:
    void require_active_(std::string_view what) const;

    const std::string m_id;
    const std::chrono::system_clock::time_point m_start_time;
    const std::optional<std::chrono::system_clock::time_point> m_deadline;

    mutable std::mutex m_mutex;
    TransactionState m_state{TransactionState::Pending};
    std::vector<OperationRecord> m_operations;
    std::vector<RollbackAction> m_rollback_actions;
    nlohmann::json m_metadata;
};

} // namespace kanbanhub::txn
