#include "utils/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace kanbanhub
{

KanbanError::KanbanError(std::string code, const std::string &message)
    : std::runtime_error(message), m_code(std::move(code))
{
}
KanbanError::~KanbanError() = default;

ValidationError::ValidationError(const std::string &message) : KanbanError("VALIDATION_ERROR", message)
{
}
ValidationError::~ValidationError() = default;

NotFoundError::NotFoundError(const std::string &entity, const std::string &id)
    : KanbanError("NOT_FOUND", fmt::format("{} not found: {}", entity, id)), m_entity(entity), m_id(id)
{
}
NotFoundError::~NotFoundError() = default;

ConflictError::ConflictError(const std::string &message) : KanbanError("CONFLICT", message) {}
ConflictError::~ConflictError() = default;

StoreError::StoreError(const std::string &message, int store_code)
    : StoreError("DATABASE_ERROR", message, store_code)
{
}
StoreError::StoreError(std::string code, const std::string &message, int store_code)
    : KanbanError(std::move(code), message), m_store_code(store_code)
{
}
StoreError::~StoreError() = default;

TransientStoreError::TransientStoreError(const std::string &message, int store_code)
    : StoreError("DATABASE_BUSY", message, store_code)
{
}
TransientStoreError::~TransientStoreError() = default;

TransactionTimeoutError::TransactionTimeoutError(const std::string &transaction_id,
                                                 std::chrono::milliseconds timeout)
    : KanbanError("TRANSACTION_TIMEOUT", fmt::format("Transaction {} timed out after {}ms",
                                                     transaction_id, timeout.count())),
      m_timeout(timeout)
{
}
TransactionTimeoutError::~TransactionTimeoutError() = default;

RollbackActionError::RollbackActionError(const std::string &transaction_id, std::size_t action_index,
                                         const std::string &cause)
    : KanbanError("ROLLBACK_FAILED", fmt::format("Rollback action {} failed in transaction {}: {}",
                                                 action_index, transaction_id, cause)),
      m_action_index(action_index)
{
}
RollbackActionError::~RollbackActionError() = default;

} // namespace kanbanhub
