#pragma once
/**
 * @file transaction_failure.hpp
 * @brief The error raised by a failed or timed-out transaction.
 */
#include <exception>
#include <string>
#include <vector>

#include "txn/transaction_context.hpp"
#include "utils/errors.hpp"

namespace kanbanhub::txn
{

/**
 * @brief Wraps the work's original error with the transaction id and its audit trail.
 *
 * The message is the original error's what(). cause() is never null: on a timeout it
 * holds a TransactionTimeoutError.
 */
class TransactionFailure : public KanbanError
{
  public:
    TransactionFailure(std::string transaction_id, const std::string &message,
                       std::vector<OperationRecord> operations, std::exception_ptr cause, bool timed_out);
    ~TransactionFailure() override;

    const std::string &transaction_id() const noexcept { return m_transaction_id; }
    const std::vector<OperationRecord> &operations() const noexcept { return m_operations; }
    std::exception_ptr cause() const noexcept { return m_cause; }
    bool timed_out() const noexcept { return m_timed_out; }

    /// Throws the original error.
    [[noreturn]] void rethrow_cause() const;

  private:
    std::string m_transaction_id;
    std::vector<OperationRecord> m_operations;
    std::exception_ptr m_cause;
    bool m_timed_out;
};

} // namespace kanbanhub::txn
