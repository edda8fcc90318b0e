#include "txn/transaction_options.hpp"

#include "utils/service_config.hpp"

namespace kanbanhub::txn
{

std::string_view to_string(IsolationLevel level) noexcept
{
    switch (level)
    {
    case IsolationLevel::ReadUncommitted:
        return "READ_UNCOMMITTED";
    case IsolationLevel::ReadCommitted:
        return "READ_COMMITTED";
    case IsolationLevel::RepeatableRead:
        return "REPEATABLE_READ";
    case IsolationLevel::Serializable:
        return "SERIALIZABLE";
    }
    return "UNKNOWN";
}

std::optional<std::string_view> isolation_directive(IsolationLevel level) noexcept
{
    switch (level)
    {
    case IsolationLevel::ReadUncommitted:
        return "PRAGMA read_uncommitted = 1";
    case IsolationLevel::ReadCommitted:
        return "PRAGMA read_uncommitted = 0";
    case IsolationLevel::RepeatableRead:
    case IsolationLevel::Serializable:
        break;
    }
    return std::nullopt;
}

TransactionOptions TransactionOptions::from_config(const ServiceConfig &config)
{
    TransactionOptions options;
    if (config.transaction_timeout().count() > 0)
        options.timeout = config.transaction_timeout();
    options.retry_attempts = config.retry_attempts();
    return options;
}

void to_json(nlohmann::json &j, const TransactionOptions &options)
{
    j = nlohmann::json{{"auto_rollback", options.auto_rollback}, {"retry_attempts", options.retry_attempts}};
    j["isolation_level"] =
        options.isolation_level ? nlohmann::json(std::string(to_string(*options.isolation_level))) : nullptr;
    j["timeout_ms"] = options.timeout ? nlohmann::json(options.timeout->count()) : nullptr;
}

} // namespace kanbanhub::txn
