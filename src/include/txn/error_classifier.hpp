#pragma once
/**
 * @file error_classifier.hpp
 * @brief Transient-versus-permanent classification of transaction errors.
 */
#include <exception>

namespace kanbanhub::txn
{

/**
 * Transient means the same work may succeed if simply run again: the store reported
 * lock contention (TransientStoreError, or a StoreError whose primary SQLite code is
 * BUSY or LOCKED). A TransactionFailure is classified by its cause. Everything else,
 * timeouts and validation errors included, is permanent.
 */
class ErrorClassifier
{
  public:
    static bool is_transient(const std::exception &error) noexcept;
    static bool is_transient(const std::exception_ptr &error) noexcept;
};

} // namespace kanbanhub::txn
