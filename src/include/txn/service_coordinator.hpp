#pragma once
/**
 * @file service_coordinator.hpp
 * @brief Sagas over the domain services, each run as one managed transaction.
 *
 * A saga is an ordered list of ServiceOperation. coordinate_multi_service_operation()
 * runs them in order inside a single TransactionManager call; for each one it records
 * the operation and registers its compensation *before* executing it, so a failure of
 * that step or any later one compensates everything started so far (in reverse).
 *
 * The composite operations below build such a list. Steps that need the outcome of an
 * earlier step (the new board's id, the created tasks) read it at execution time from
 * state shared between the step closures.
 *
 * Compensations run after the store transaction itself was rolled back, so they must
 * tolerate their forward effect being gone already; every compensation here is a
 * "delete if present" or "restore if absent".
 *
 * With a timeout, a step may still be running on the abandoned worker while the
 * compensations run on the calling thread. The shared state is locked, and a step
 * that completes after compensation has begun undoes its own effect and throws.
 */
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "store/board_service.hpp"
#include "store/dependency_service.hpp"
#include "store/models.hpp"
#include "store/note_service.hpp"
#include "store/tag_service.hpp"
#include "store/task_service.hpp"
#include "txn/transaction_manager.hpp"

namespace kanbanhub::txn
{

/// A named unit of work inside a saga. rollback_action may be empty.
struct ServiceOperation
{
    std::string service_name;
    std::string method_name;
    std::function<nlohmann::json()> execute;
    std::function<void()> rollback_action;
};

/// The services composite operations are built from. All must outlive the coordinator.
struct DomainServices
{
    store::BoardService &boards;
    store::TaskService &tasks;
    store::TagService &tags;
    store::DependencyService &dependencies;
    store::NoteService &notes;
};

struct CreateBoardResult
{
    store::Board board;
    std::vector<store::Task> tasks;
    std::vector<store::Tag> tags;
};

struct MoveTaskResult
{
    store::Task moved_task;
    std::vector<store::TaskDependency> updated_dependencies;
};

struct DeleteTaskResult
{
    store::Task deleted_task;
    std::vector<store::Task> orphaned_subtasks;
    std::vector<store::TaskDependency> removed_dependencies;
    std::vector<store::Note> deleted_notes;
};

struct BulkCreateOptions
{
    /// Tag ids linked to every created task.
    std::vector<std::string> assign_tags;
    /// Make task[i] depend on task[i-1] for each consecutive pair.
    bool create_dependencies = false;
};

struct BulkCreateResult
{
    std::vector<store::Task> tasks;
    std::vector<store::TaskTag> assigned_tags;
    std::vector<store::TaskDependency> created_dependencies;
};

struct TransactionMetrics
{
    std::size_t active_transactions = 0;
    std::size_t total_operations = 0;
    double avg_operations_per_transaction = 0.0;
};

void to_json(nlohmann::json &j, const TransactionMetrics &metrics);

class ServiceTransactionCoordinator
{
  public:
    ServiceTransactionCoordinator(TransactionManager &manager, DomainServices services);

    /**
     * @brief Runs @p operations in order in one transaction.
     * @return Each operation's result, in input order.
     * @throws TransactionFailure if any operation throws; nothing partial is returned.
     */
    std::vector<nlohmann::json> coordinate_multi_service_operation(std::vector<ServiceOperation> operations,
                                                                   const TransactionOptions &options = {});

    /**
     * @brief Creates a board with seed tasks (in its first column) and tags.
     *
     * Seed tasks have board_id / column_id filled in; tags are created unlinked.
     */
    CreateBoardResult create_board(const store::CreateBoardRequest &board,
                                   const std::vector<store::CreateTaskRequest> &initial_tasks = {},
                                   const std::vector<store::CreateTagRequest> &initial_tags = {},
                                   const TransactionOptions &options = {});

    /**
     * @brief Moves a task and touches every task that depends on it.
     * @return The moved task and the dependency edges touching it.
     * @throws TransactionFailure with a ValidationError cause if the target column is
     *         on another board.
     */
    MoveTaskResult move_task_with_dependencies(const std::string &task_id, const std::string &target_column_id,
                                               std::optional<int> position = std::nullopt,
                                               const TransactionOptions &options = {});

    /**
     * @brief Deletes a task after detaching its notes, dependencies and subtasks.
     *
     * Subtasks are re-parented to the deleted task's parent (top-level if it had none).
     */
    DeleteTaskResult delete_task_cascade(const std::string &task_id, const TransactionOptions &options = {});

    BulkCreateResult bulk_create_tasks(const std::vector<store::CreateTaskRequest> &tasks,
                                       const BulkCreateOptions &bulk_options = {},
                                       const TransactionOptions &options = {});

    /// Derived from the manager's registry only.
    TransactionMetrics get_transaction_metrics() const;

    /// Runs arbitrary work in a managed transaction; used by TransactionDecorator.
    template <typename F> decltype(auto) run_in_transaction(F &&work, const TransactionOptions &options = {})
    {
        return m_manager.execute_transaction(std::forward<F>(work), options);
    }

    TransactionManager &transaction_manager() noexcept { return m_manager; }

  private:
    TransactionManager &m_manager;
    DomainServices m_services;
};

} // namespace kanbanhub::txn
