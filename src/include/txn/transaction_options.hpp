#pragma once
/**
 * @file transaction_options.hpp
 * @brief Per-call options of TransactionManager::execute_transaction.
 */
#include <chrono>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kanbanhub
{
class ServiceConfig;
} // namespace kanbanhub

namespace kanbanhub::txn
{

enum class IsolationLevel
{
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable
};

/// "READ_UNCOMMITTED", "READ_COMMITTED", "REPEATABLE_READ", "SERIALIZABLE".
std::string_view to_string(IsolationLevel level) noexcept;

/**
 * @brief The SQLite directive that realises @p level inside an open transaction.
 *
 * | Level            | Directive                     |
 * |------------------|-------------------------------|
 * | ReadUncommitted  | PRAGMA read_uncommitted = 1   |
 * | ReadCommitted    | PRAGMA read_uncommitted = 0   |
 * | RepeatableRead   | (none)                        |
 * | Serializable     | (none)                        |
 *
 * SQLite transactions are already serializable, so the last two need nothing.
 */
std::optional<std::string_view> isolation_directive(IsolationLevel level) noexcept;

struct TransactionOptions
{
    std::optional<IsolationLevel> isolation_level;
    /// Soft deadline for the work; unset means wait forever.
    std::optional<std::chrono::milliseconds> timeout;
    /// Run the registered compensations when the transaction fails.
    bool auto_rollback = true;
    /// Extra attempts made by execute_transaction_with_retry on transient failures.
    int retry_attempts = 0;

    /// Timeout and retry count from the "transactions" section; a timeout of 0 is unset.
    static TransactionOptions from_config(const ServiceConfig &config);
};

/// Stored in the transaction's metadata bag.
void to_json(nlohmann::json &j, const TransactionOptions &options);

} // namespace kanbanhub::txn
