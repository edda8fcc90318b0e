#include "txn/transaction_failure.hpp"

#include <utility>

namespace kanbanhub::txn
{

TransactionFailure::TransactionFailure(std::string transaction_id, const std::string &message,
                                       std::vector<OperationRecord> operations, std::exception_ptr cause,
                                       bool timed_out)
    : KanbanError("TRANSACTION_FAILED", message), m_transaction_id(std::move(transaction_id)),
      m_operations(std::move(operations)), m_cause(std::move(cause)), m_timed_out(timed_out)
{
}

TransactionFailure::~TransactionFailure() = default;

void TransactionFailure::rethrow_cause() const
{
    if (m_cause)
        std::rethrow_exception(m_cause);
    throw KanbanError("TRANSACTION_FAILED", what());
}

} // namespace kanbanhub::txn
