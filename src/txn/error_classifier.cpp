#include "txn/error_classifier.hpp"

#include "txn/transaction_failure.hpp"
#include "utils/errors.hpp"

namespace kanbanhub::txn
{

namespace
{
// Primary SQLite result codes; the low byte of an extended code.
constexpr int kSqliteBusy = 5;
constexpr int kSqliteLocked = 6;
} // namespace

bool ErrorClassifier::is_transient(const std::exception &error) noexcept
{
    if (const auto *failure = dynamic_cast<const TransactionFailure *>(&error))
        return is_transient(failure->cause());
    if (dynamic_cast<const TransientStoreError *>(&error) != nullptr)
        return true;
    if (const auto *store = dynamic_cast<const StoreError *>(&error))
    {
        const int primary = store->store_code() & 0xff;
        return primary == kSqliteBusy || primary == kSqliteLocked;
    }
    return false;
}

bool ErrorClassifier::is_transient(const std::exception_ptr &error) noexcept
{
    if (!error)
        return false;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        return is_transient(e);
    }
    catch (...)
    {
        // Not derived from std::exception; nothing to classify.
        return false;
    }
}

} // namespace kanbanhub::txn
