#include "txn/service_coordinator.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace kanbanhub::txn
{

using nlohmann::json;

namespace
{

std::string first_column_of(store::BoardService &boards, const std::string &board_id)
{
    auto columns = boards.get_columns(board_id);
    if (columns.empty())
        throw ValidationError(fmt::format("Board {} has no columns", board_id));
    return columns.front().id;
}

/**
 * State shared by the steps of one composite call and their compensations.
 *
 * With a timeout the steps run on a worker the manager may abandon, while the
 * compensations run on the calling thread. A step records each effect through
 * publish(); a compensation reads what was recorded through claim(). Once anything
 * has been claimed, publish() refuses and the step has to undo its effect itself.
 */
class SagaState
{
  public:
    template <typename F> bool publish(F &&record)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_compensating)
            return false;
        record();
        return true;
    }

    template <typename F> auto claim(F &&read)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_compensating = true;
        return read();
    }

  private:
    std::mutex m_mutex;
    bool m_compensating = false;
};

template <typename Entity> std::optional<std::string> id_at(const std::vector<Entity> &entities, std::size_t i)
{
    if (i < entities.size())
        return entities[i].id;
    return std::nullopt;
}

[[noreturn]] void undone_late(std::string_view step)
{
    throw ValidationError(fmt::format("{} finished after its transaction was rolled back; effect undone", step));
}

/// Puts a task back in the column and position of @p before, with its old updated_at.
void restore_placement(store::TaskService &tasks, const store::Task &before)
{
    auto current = tasks.get_task(before.id);
    if (!current)
        return;
    if (current->column_id != before.column_id || current->position != before.position)
        tasks.move_task(before.id, before.column_id, before.position);
    tasks.set_updated_at(before.id, before.updated_at);
}

} // namespace

void to_json(json &j, const TransactionMetrics &metrics)
{
    j = json{{"active_transactions", metrics.active_transactions},
             {"total_operations", metrics.total_operations},
             {"avg_operations_per_transaction", metrics.avg_operations_per_transaction}};
}

ServiceTransactionCoordinator::ServiceTransactionCoordinator(TransactionManager &manager, DomainServices services)
    : m_manager(manager), m_services(services)
{
}

std::vector<json> ServiceTransactionCoordinator::coordinate_multi_service_operation(
    std::vector<ServiceOperation> operations, const TransactionOptions &options)
{
    for (const auto &op : operations)
    {
        if (!op.execute)
            throw ValidationError(fmt::format("{}.{} has no execute function", op.service_name, op.method_name));
    }

    auto ops = std::make_shared<const std::vector<ServiceOperation>>(std::move(operations));
    return m_manager.execute_transaction(
        [this, ops](TransactionContext &context)
        {
            std::vector<json> results;
            results.reserve(ops->size());
            for (const auto &op : *ops)
            {
                m_manager.add_operation(context, op.service_name, op.method_name);
                if (op.rollback_action)
                    m_manager.add_rollback_action(context, op.rollback_action);
                try
                {
                    results.push_back(op.execute());
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("ServiceTransactionCoordinator: {}.{} failed in {}: {}", op.service_name,
                                 op.method_name, context.id(), e.what());
                    throw;
                }
            }
            return results;
        },
        options);
}

// ---------------------------------------------------------------------------
// create_board
// ---------------------------------------------------------------------------

CreateBoardResult ServiceTransactionCoordinator::create_board(const store::CreateBoardRequest &board,
                                                              const std::vector<store::CreateTaskRequest> &initial_tasks,
                                                              const std::vector<store::CreateTagRequest> &initial_tags,
                                                              const TransactionOptions &options)
{
    struct State : SagaState
    {
        std::optional<store::Board> board;
        std::string first_column_id; // steps only
        std::vector<store::Task> tasks;
        std::vector<store::Tag> tags;
    };
    auto state = std::make_shared<State>();
    const DomainServices svc = m_services;

    std::vector<ServiceOperation> ops;
    ops.reserve(1 + initial_tasks.size() + initial_tags.size());

    ops.push_back(ServiceOperation{
        .service_name = "BoardService",
        .method_name = "createBoard",
        .execute =
            [svc, state, board]()
        {
            auto created = svc.boards.create_board(board);
            if (!state->publish([&] { state->board = created; }))
            {
                svc.boards.delete_board(created.id);
                undone_late("BoardService.createBoard");
            }
            state->first_column_id = first_column_of(svc.boards, created.id);
            return json(created);
        },
        .rollback_action =
            [svc, state]()
        {
            auto board_id = state->claim(
                [&]() -> std::optional<std::string>
                {
                    if (state->board)
                        return state->board->id;
                    return std::nullopt;
                });
            if (board_id)
                svc.boards.delete_board(*board_id);
        }});

    for (std::size_t i = 0; i < initial_tasks.size(); ++i)
    {
        ops.push_back(ServiceOperation{
            .service_name = "TaskService",
            .method_name = "createTask",
            .execute =
                [svc, state, request = initial_tasks[i]]()
            {
                auto seeded = request;
                seeded.board_id = state->board->id;
                seeded.column_id = state->first_column_id;
                auto task = svc.tasks.create_task(seeded);
                if (!state->publish([&] { state->tasks.push_back(task); }))
                {
                    svc.tasks.delete_task(task.id);
                    undone_late("TaskService.createTask");
                }
                return json(task);
            },
            .rollback_action =
                [svc, state, i]()
            {
                if (auto id = state->claim([&] { return id_at(state->tasks, i); }))
                    svc.tasks.delete_task(*id);
            }});
    }

    for (std::size_t i = 0; i < initial_tags.size(); ++i)
    {
        ops.push_back(ServiceOperation{
            .service_name = "TagService",
            .method_name = "createTag",
            .execute =
                [svc, state, request = initial_tags[i]]()
            {
                auto tag = svc.tags.create_tag(request);
                if (!state->publish([&] { state->tags.push_back(tag); }))
                {
                    svc.tags.delete_tag(tag.id);
                    undone_late("TagService.createTag");
                }
                return json(tag);
            },
            .rollback_action =
                [svc, state, i]()
            {
                if (auto id = state->claim([&] { return id_at(state->tags, i); }))
                    svc.tags.delete_tag(*id);
            }});
    }

    coordinate_multi_service_operation(std::move(ops), options);
    return CreateBoardResult{.board = *state->board, .tasks = state->tasks, .tags = state->tags};
}

// ---------------------------------------------------------------------------
// move_task_with_dependencies
// ---------------------------------------------------------------------------

MoveTaskResult ServiceTransactionCoordinator::move_task_with_dependencies(const std::string &task_id,
                                                                          const std::string &target_column_id,
                                                                          std::optional<int> position,
                                                                          const TransactionOptions &options)
{
    struct State : SagaState
    {
        std::optional<store::Task> before;
        std::optional<store::Task> moved;
        std::vector<store::TaskDependency> dependencies;
        std::vector<std::pair<std::string, std::string>> touched; // id, previous updated_at
    };
    auto state = std::make_shared<State>();
    const DomainServices svc = m_services;

    std::vector<ServiceOperation> ops;

    ops.push_back(ServiceOperation{
        .service_name = "TaskService",
        .method_name = "getTask",
        .execute =
            [svc, state, task_id, target_column_id]()
        {
            auto before = svc.tasks.require_task(task_id);
            auto column = svc.boards.get_column(target_column_id);
            if (!column)
                throw NotFoundError("Column", target_column_id);
            if (column->board_id != before.board_id)
                throw ValidationError(fmt::format("Column {} belongs to board {}, task {} to board {}",
                                                  target_column_id, column->board_id, task_id, before.board_id));
            // First step, no compensation registered yet: nothing can have claimed.
            state->publish([&] { state->before = before; });
            return json(before);
        },
        .rollback_action = {}});

    ops.push_back(ServiceOperation{
        .service_name = "TaskService",
        .method_name = "moveTask",
        .execute =
            [svc, state, task_id, target_column_id, position]()
        {
            auto moved = svc.tasks.move_task(task_id, target_column_id, position);
            if (!state->publish([&] { state->moved = moved; }))
            {
                restore_placement(svc.tasks, *state->before);
                undone_late("TaskService.moveTask");
            }
            return json(moved);
        },
        .rollback_action =
            [svc, state]()
        {
            if (auto before = state->claim([&] { return state->before; }))
                restore_placement(svc.tasks, *before);
        }});

    ops.push_back(ServiceOperation{
        .service_name = "DependencyService",
        .method_name = "updateDependents",
        .execute =
            [svc, state, task_id]()
        {
            state->dependencies = svc.dependencies.get_dependencies_for_task(task_id);
            for (const auto &dep : state->dependencies)
            {
                if (dep.depends_on_task_id != task_id)
                    continue;
                auto dependent = svc.tasks.get_task(dep.task_id);
                if (!dependent)
                    continue;
                svc.tasks.touch_task(dependent->id);
                if (!state->publish([&] { state->touched.emplace_back(dependent->id, dependent->updated_at); }))
                {
                    svc.tasks.set_updated_at(dependent->id, dependent->updated_at);
                    undone_late("DependencyService.updateDependents");
                }
            }
            return json(state->dependencies);
        },
        .rollback_action =
            [svc, state]()
        {
            auto touched = state->claim([&] { return state->touched; });
            for (auto it = touched.rbegin(); it != touched.rend(); ++it)
                svc.tasks.set_updated_at(it->first, it->second);
        }});

    coordinate_multi_service_operation(std::move(ops), options);
    return MoveTaskResult{.moved_task = *state->moved, .updated_dependencies = state->dependencies};
}

// ---------------------------------------------------------------------------
// delete_task_cascade
// ---------------------------------------------------------------------------

DeleteTaskResult ServiceTransactionCoordinator::delete_task_cascade(const std::string &task_id,
                                                                    const TransactionOptions &options)
{
    struct State : SagaState
    {
        std::optional<store::Task> task;
        std::vector<store::Task> subtasks; // steps only
        std::vector<store::Note> notes;
        std::vector<store::TaskDependency> dependencies;
        std::vector<store::Task> reparented;
        std::vector<std::string> tag_ids;
    };
    auto state = std::make_shared<State>();
    const DomainServices svc = m_services;

    std::vector<ServiceOperation> ops;

    ops.push_back(ServiceOperation{
        .service_name = "TaskService",
        .method_name = "getTask",
        .execute =
            [svc, state, task_id]()
        {
            auto task = svc.tasks.require_task(task_id);
            state->subtasks = svc.tasks.get_subtasks(task_id);
            state->publish([&] { state->task = task; });
            return json(task);
        },
        .rollback_action = {}});

    ops.push_back(ServiceOperation{
        .service_name = "NoteService",
        .method_name = "deleteTaskNotes",
        .execute =
            [svc, state, task_id]()
        {
            auto notes = svc.notes.delete_task_notes(task_id);
            if (!state->publish([&] { state->notes = notes; }))
            {
                for (const auto &note : notes)
                    svc.notes.restore_note(note);
                undone_late("NoteService.deleteTaskNotes");
            }
            return json(notes);
        },
        .rollback_action =
            [svc, state]()
        {
            for (const auto &note : state->claim([&] { return state->notes; }))
                svc.notes.restore_note(note);
        }});

    ops.push_back(ServiceOperation{
        .service_name = "DependencyService",
        .method_name = "removeDependencies",
        .execute =
            [svc, state, task_id]()
        {
            std::vector<store::TaskDependency> removed;
            for (const auto &dep : svc.dependencies.get_dependencies_for_task(task_id))
            {
                if (!svc.dependencies.remove_dependency(dep.id))
                    continue;
                if (!state->publish([&] { state->dependencies.push_back(dep); }))
                {
                    svc.dependencies.restore_dependency(dep);
                    undone_late("DependencyService.removeDependencies");
                }
                removed.push_back(dep);
            }
            return json(removed);
        },
        .rollback_action =
            [svc, state]()
        {
            for (const auto &dep : state->claim([&] { return state->dependencies; }))
                svc.dependencies.restore_dependency(dep);
        }});

    ops.push_back(ServiceOperation{
        .service_name = "TaskService",
        .method_name = "reparentSubtasks",
        .execute =
            [svc, state, task_id]()
        {
            std::vector<store::Task> moved;
            for (auto subtask : state->subtasks)
            {
                svc.tasks.set_parent(subtask.id, state->task->parent_task_id);
                subtask.parent_task_id = state->task->parent_task_id;
                if (!state->publish([&] { state->reparented.push_back(subtask); }))
                {
                    svc.tasks.set_parent(subtask.id, task_id);
                    undone_late("TaskService.reparentSubtasks");
                }
                moved.push_back(std::move(subtask));
            }
            return json(moved);
        },
        .rollback_action =
            [svc, state, task_id]()
        {
            for (const auto &subtask : state->claim([&] { return state->reparented; }))
                svc.tasks.set_parent(subtask.id, task_id);
        }});

    ops.push_back(ServiceOperation{
        .service_name = "TaskService",
        .method_name = "deleteTask",
        .execute =
            [svc, state, task_id]()
        {
            std::vector<std::string> tag_ids;
            for (const auto &tag : svc.tags.get_task_tags(task_id))
                tag_ids.push_back(tag.id);
            if (!svc.tasks.delete_task(task_id))
                throw NotFoundError("Task", task_id);
            if (!state->publish([&] { state->tag_ids = tag_ids; }))
            {
                svc.tasks.restore_task(*state->task);
                for (const auto &tag_id : tag_ids)
                    svc.tags.add_tag_to_task(task_id, tag_id);
                undone_late("TaskService.deleteTask");
            }
            return json{{"id", task_id}, {"deleted", true}};
        },
        .rollback_action =
            [svc, state, task_id]()
        {
            auto [task, tag_ids] = state->claim([&] { return std::make_pair(state->task, state->tag_ids); });
            if (!task)
                return;
            svc.tasks.restore_task(*task);
            auto linked = svc.tags.get_task_tags(task_id);
            for (const auto &tag_id : tag_ids)
            {
                const bool present = std::any_of(linked.begin(), linked.end(),
                                                 [&tag_id](const store::Tag &t) { return t.id == tag_id; });
                if (!present)
                    svc.tags.add_tag_to_task(task_id, tag_id);
            }
        }});

    coordinate_multi_service_operation(std::move(ops), options);
    return DeleteTaskResult{.deleted_task = *state->task,
                            .orphaned_subtasks = state->reparented,
                            .removed_dependencies = state->dependencies,
                            .deleted_notes = state->notes};
}

// ---------------------------------------------------------------------------
// bulk_create_tasks
// ---------------------------------------------------------------------------

BulkCreateResult ServiceTransactionCoordinator::bulk_create_tasks(const std::vector<store::CreateTaskRequest> &tasks,
                                                                  const BulkCreateOptions &bulk_options,
                                                                  const TransactionOptions &options)
{
    struct State : SagaState
    {
        std::vector<store::Task> created;
        // Sized before the saga starts; one slot per link step.
        std::vector<std::optional<store::TaskTag>> links;
        std::vector<std::optional<store::TaskDependency>> dependencies;
    };
    auto state = std::make_shared<State>();
    const DomainServices svc = m_services;
    const std::size_t n = tasks.size();

    std::vector<ServiceOperation> ops;

    for (std::size_t i = 0; i < n; ++i)
    {
        ops.push_back(ServiceOperation{
            .service_name = "TaskService",
            .method_name = "createTask",
            .execute =
                [svc, state, request = tasks[i]]()
            {
                auto filled = request;
                if (filled.board_id && !filled.column_id)
                    filled.column_id = first_column_of(svc.boards, *filled.board_id);
                auto task = svc.tasks.create_task(filled);
                if (!state->publish([&] { state->created.push_back(task); }))
                {
                    svc.tasks.delete_task(task.id);
                    undone_late("TaskService.createTask");
                }
                return json(task);
            },
            .rollback_action =
                [svc, state, i]()
            {
                if (auto id = state->claim([&] { return id_at(state->created, i); }))
                    svc.tasks.delete_task(*id);
            }});
    }

    for (const auto &tag_id : bulk_options.assign_tags)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            const std::size_t slot = state->links.size();
            state->links.emplace_back();
            ops.push_back(ServiceOperation{
                .service_name = "TagService",
                .method_name = "addTagToTask",
                .execute =
                    [svc, state, tag_id, i, slot]()
                {
                    auto link = svc.tags.add_tag_to_task(state->created.at(i).id, tag_id);
                    if (!state->publish([&] { state->links[slot] = link; }))
                    {
                        svc.tags.remove_tag_from_task(link.task_id, link.tag_id);
                        undone_late("TagService.addTagToTask");
                    }
                    return json(link);
                },
                .rollback_action =
                    [svc, state, slot]()
                {
                    if (auto link = state->claim([&] { return state->links[slot]; }))
                        svc.tags.remove_tag_from_task(link->task_id, link->tag_id);
                }});
        }
    }

    if (bulk_options.create_dependencies)
    {
        for (std::size_t i = 1; i < n; ++i)
        {
            const std::size_t slot = state->dependencies.size();
            state->dependencies.emplace_back();
            ops.push_back(ServiceOperation{
                .service_name = "DependencyService",
                .method_name = "addDependency",
                .execute =
                    [svc, state, i, slot]()
                {
                    auto dep = svc.dependencies.add_dependency(state->created.at(i).id, state->created.at(i - 1).id);
                    if (!state->publish([&] { state->dependencies[slot] = dep; }))
                    {
                        svc.dependencies.remove_dependency(dep.id);
                        undone_late("DependencyService.addDependency");
                    }
                    return json(dep);
                },
                .rollback_action =
                    [svc, state, slot]()
                {
                    if (auto dep = state->claim([&] { return state->dependencies[slot]; }))
                        svc.dependencies.remove_dependency(dep->id);
                }});
        }
    }

    coordinate_multi_service_operation(std::move(ops), options);

    BulkCreateResult result{.tasks = state->created, .assigned_tags = {}, .created_dependencies = {}};
    for (const auto &link : state->links)
        result.assigned_tags.push_back(*link);
    for (const auto &dep : state->dependencies)
        result.created_dependencies.push_back(*dep);
    return result;
}

TransactionMetrics ServiceTransactionCoordinator::get_transaction_metrics() const
{
    const auto active = m_manager.get_active_transactions();
    TransactionMetrics metrics;
    metrics.active_transactions = active.size();
    for (const auto &info : active)
        metrics.total_operations += info.operations.size();
    if (metrics.active_transactions > 0)
        metrics.avg_operations_per_transaction =
            static_cast<double>(metrics.total_operations) / static_cast<double>(metrics.active_transactions);
    return metrics;
}

} // namespace kanbanhub::txn
