#pragma once
/**
 * @file kbh_txn.hpp
 * @brief Layer 4: Transaction coordination built on kbh_store.
 *
 * Include this single header for TransactionManager, the saga coordinator with its
 * composite board/task operations, and the transactional decorator.
 */
#include "kbh_store.hpp"

#include "txn/transaction_options.hpp"
#include "txn/transaction_context.hpp"
#include "txn/transaction_failure.hpp"
#include "txn/transaction_registry.hpp"
#include "txn/error_classifier.hpp"
#include "txn/transaction_manager.hpp"
#include "txn/service_coordinator.hpp"
#include "txn/transactional.hpp"
