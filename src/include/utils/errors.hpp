#pragma once
/**
 * @file errors.hpp
 * @brief Exception taxonomy shared by the store and transaction layers.
 *
 * Every error raised by kanbanhub derives from KanbanError and carries a stable
 * string code. The codes are part of the public contract; callers may switch on them.
 *
 * | Class                    | code()                |
 * |--------------------------|-----------------------|
 * | ValidationError          | VALIDATION_ERROR      |
 * | NotFoundError            | NOT_FOUND             |
 * | ConflictError            | CONFLICT              |
 * | StoreError               | DATABASE_ERROR        |
 * | TransientStoreError      | DATABASE_BUSY         |
 * | TransactionTimeoutError  | TRANSACTION_TIMEOUT   |
 * | RollbackActionError      | ROLLBACK_FAILED       |
 *
 * TransactionFailure (TRANSACTION_FAILED) lives in txn/transaction_failure.hpp
 * because it carries the transaction's operation list.
 */
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "kanbanhub_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace kanbanhub
{

class KANBANHUB_UTILS_EXPORT KanbanError : public std::runtime_error
{
  public:
    KanbanError(std::string code, const std::string &message);
    ~KanbanError() override;

    const std::string &code() const noexcept { return m_code; }

  private:
    std::string m_code;
};

/// Caller misuse or input that violates a constraint. Never retried.
class KANBANHUB_UTILS_EXPORT ValidationError : public KanbanError
{
  public:
    explicit ValidationError(const std::string &message);
    ~ValidationError() override;
};

class KANBANHUB_UTILS_EXPORT NotFoundError : public KanbanError
{
  public:
    NotFoundError(const std::string &entity, const std::string &id);
    ~NotFoundError() override;

    const std::string &entity() const noexcept { return m_entity; }
    const std::string &id() const noexcept { return m_id; }

  private:
    std::string m_entity;
    std::string m_id;
};

/// A uniqueness constraint was violated.
class KANBANHUB_UTILS_EXPORT ConflictError : public KanbanError
{
  public:
    explicit ConflictError(const std::string &message);
    ~ConflictError() override;
};

/**
 * @brief Any other failure reported by the store.
 *
 * @c store_code() is the store's native result code (an SQLite extended result code
 * for the SQLite Database), or 0 when the failure did not originate in the engine.
 */
class KANBANHUB_UTILS_EXPORT StoreError : public KanbanError
{
  public:
    StoreError(const std::string &message, int store_code);
    ~StoreError() override;

    int store_code() const noexcept { return m_store_code; }

  protected:
    StoreError(std::string code, const std::string &message, int store_code);

  private:
    int m_store_code;
};

/// Lock contention (SQLITE_BUSY / SQLITE_LOCKED). Safe to retry.
class KANBANHUB_UTILS_EXPORT TransientStoreError : public StoreError
{
  public:
    TransientStoreError(const std::string &message, int store_code);
    ~TransientStoreError() override;
};

/// The transaction's deadline fired before its work finished.
class KANBANHUB_UTILS_EXPORT TransactionTimeoutError : public KanbanError
{
  public:
    TransactionTimeoutError(const std::string &transaction_id, std::chrono::milliseconds timeout);
    ~TransactionTimeoutError() override;

    std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

  private:
    std::chrono::milliseconds m_timeout;
};

/**
 * @brief A compensating action failed during rollback.
 *
 * Only ever logged; rollback continues with the remaining actions and the caller sees
 * the transaction's original error.
 */
class KANBANHUB_UTILS_EXPORT RollbackActionError : public KanbanError
{
  public:
    RollbackActionError(const std::string &transaction_id, std::size_t action_index,
                        const std::string &cause);
    ~RollbackActionError() override;

    std::size_t action_index() const noexcept { return m_action_index; }

  private:
    std::size_t m_action_index;
};

} // namespace kanbanhub

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
