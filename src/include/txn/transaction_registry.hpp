#pragma once
/**
 * @file transaction_registry.hpp
 * @brief The set of live transactions, keyed by transaction id.
 *
 * Only the TransactionManager inserts and erases. Readers get copies.
 */
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "txn/transaction_context.hpp"

namespace kanbanhub::txn
{

class TransactionRegistry
{
  public:
    /// @throws ValidationError if the id is already registered.
    void insert(std::shared_ptr<TransactionContext> context);

    /// @return false if the id was not registered.
    bool erase(const std::string &id) noexcept;

    std::size_t size() const;
    bool contains(const std::string &id) const;

    std::optional<TransactionInfo> find(const std::string &id) const;
    std::vector<TransactionInfo> snapshot() const;

    /// Sum of operation counts over all live transactions.
    std::size_t total_operations() const;

  private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<TransactionContext>> m_contexts;
};

} // namespace kanbanhub::txn
