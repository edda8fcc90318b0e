#pragma once
/**
 * @file store.hpp
 * @brief The two primitives the transaction layer needs from a persistent store.
 */
#include <functional>
#include <string_view>

namespace kanbanhub::store
{

/**
 * @class Store
 * @brief Abstract local-transaction store.
 *
 * Implementations:
 * - store::Database (SQLite)
 * - recording fakes in the tests
 */
class Store
{
  public:
    virtual ~Store() = default;

    /**
     * @brief Runs @p body inside a begin/commit envelope.
     *
     * If @p body throws, the store transaction is rolled back and the exception is
     * rethrown unchanged. Transactions on one store are serialised.
     */
    virtual void transaction(const std::function<void()> &body) = 0;

    /**
     * @brief Executes a raw directive (e.g. a pragma) on the store's connection.
     */
    virtual void exec(std::string_view directive) = 0;
};

} // namespace kanbanhub::store
