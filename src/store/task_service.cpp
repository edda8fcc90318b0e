#include "store/task_service.hpp"

#include <algorithm>

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kTaskColumns = "id, board_id, column_id, parent_task_id, title, description, "
                                     "position, priority, due_date, created_at, updated_at, archived";

Task read_task(const Statement &st)
{
    return Task{.id = st.column_text(0),
                .board_id = st.column_text(1),
                .column_id = st.column_text(2),
                .parent_task_id = st.column_optional_text(3),
                .title = st.column_text(4),
                .description = st.column_text(5),
                .position = st.column_int(6),
                .priority = st.column_text(7),
                .due_date = st.column_optional_text(8),
                .created_at = st.column_text(9),
                .updated_at = st.column_text(10),
                .archived = st.column_bool(11)};
}

bool is_valid_priority(const std::string &p)
{
    return p == "low" || p == "medium" || p == "high";
}

} // namespace

int TaskService::next_position(const std::string &column_id)
{
    auto st = m_db.prepare("SELECT COALESCE(MAX(position), -1) + 1 FROM tasks WHERE column_id = ?");
    st.bind(1, column_id);
    return st.step() ? st.column_int(0) : 0;
}

void TaskService::shift_for_insertion(const std::string &column_id, int position)
{
    m_db.prepare("UPDATE tasks SET position = position + 1 WHERE column_id = ? AND position >= ?")
        .bind_all(column_id, position)
        .run();
}

void TaskService::shift_for_removal(const std::string &column_id, int position)
{
    m_db.prepare("UPDATE tasks SET position = position - 1 WHERE column_id = ? AND position > ?")
        .bind_all(column_id, position)
        .run();
}

Task TaskService::create_task(const CreateTaskRequest &request)
{
    if (request.title.empty())
        throw ValidationError("Task title must not be empty");
    if (!request.board_id || request.board_id->empty())
        throw ValidationError("Task board_id is required");
    if (!request.column_id || request.column_id->empty())
        throw ValidationError("Task column_id is required");
    if (!is_valid_priority(request.priority))
        throw ValidationError(fmt::format("Unknown task priority '{}'", request.priority));
    if (request.position && *request.position < 0)
        throw ValidationError("Task position must not be negative");

    {
        auto st = m_db.prepare("SELECT board_id FROM columns WHERE id = ?");
        st.bind(1, *request.column_id);
        if (!st.step())
            throw NotFoundError("Column", *request.column_id);
        if (st.column_text(0) != *request.board_id)
            throw ValidationError(fmt::format("Column {} does not belong to board {}", *request.column_id,
                                              *request.board_id));
    }
    if (request.parent_task_id && !get_task(*request.parent_task_id))
        throw NotFoundError("Task", *request.parent_task_id);

    const int append_at = next_position(*request.column_id);
    const int position = request.position ? std::min(*request.position, append_at) : append_at;
    if (position < append_at)
        shift_for_insertion(*request.column_id, position);

    const auto now = format_tools::iso8601_now();
    Task task{.id = uid::generate_uuid(),
              .board_id = *request.board_id,
              .column_id = *request.column_id,
              .parent_task_id = request.parent_task_id,
              .title = request.title,
              .description = request.description,
              .position = position,
              .priority = request.priority,
              .due_date = request.due_date,
              .created_at = now,
              .updated_at = now,
              .archived = false};

    m_db.prepare("INSERT INTO tasks (id, board_id, column_id, parent_task_id, title, description, position, "
                 "priority, due_date, created_at, updated_at, archived) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0)")
        .bind_all(task.id, task.board_id, task.column_id, task.parent_task_id, task.title, task.description,
                  task.position, task.priority, task.due_date, task.created_at, task.updated_at)
        .run();

    LOGGER_DEBUG("TaskService: created task {} '{}' at {}:{}", task.id, task.title, task.column_id,
                 task.position);
    return task;
}

std::optional<Task> TaskService::get_task(const std::string &id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM tasks WHERE id = ?", kTaskColumns));
    st.bind(1, id);
    if (!st.step())
        return std::nullopt;
    return read_task(st);
}

Task TaskService::require_task(const std::string &id)
{
    auto task = get_task(id);
    if (!task)
        throw NotFoundError("Task", id);
    return *task;
}

std::vector<Task> TaskService::get_subtasks(const std::string &parent_id)
{
    auto st = m_db.prepare(
        fmt::format("SELECT {} FROM tasks WHERE parent_task_id = ? ORDER BY created_at, id", kTaskColumns));
    st.bind(1, parent_id);
    std::vector<Task> tasks;
    while (st.step())
        tasks.push_back(read_task(st));
    return tasks;
}

std::vector<Task> TaskService::get_column_tasks(const std::string &column_id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM tasks WHERE column_id = ? ORDER BY position", kTaskColumns));
    st.bind(1, column_id);
    std::vector<Task> tasks;
    while (st.step())
        tasks.push_back(read_task(st));
    return tasks;
}

Task TaskService::move_task(const std::string &id, const std::string &column_id, std::optional<int> position)
{
    auto task = require_task(id);
    {
        auto st = m_db.prepare("SELECT board_id FROM columns WHERE id = ?");
        st.bind(1, column_id);
        if (!st.step())
            throw NotFoundError("Column", column_id);
        if (st.column_text(0) != task.board_id)
            throw ValidationError(
                fmt::format("Column {} is not on the board of task {}", column_id, task.id));
    }
    if (position && *position < 0)
        throw ValidationError("Task position must not be negative");

    // Take the task out of its slot first; positions are then computed without it.
    m_db.prepare("UPDATE tasks SET position = -1 WHERE id = ?").bind(1, id).run();
    shift_for_removal(task.column_id, task.position);

    int append_at = 0;
    {
        auto st = m_db.prepare(
            "SELECT COALESCE(MAX(position), -1) + 1 FROM tasks WHERE column_id = ? AND id != ?");
        st.bind_all(column_id, id);
        append_at = st.step() ? st.column_int(0) : 0;
    }
    const int target = position ? std::min(*position, append_at) : append_at;
    if (target < append_at)
        shift_for_insertion(column_id, target);

    const auto now = format_tools::iso8601_now();
    m_db.prepare("UPDATE tasks SET column_id = ?, position = ?, updated_at = ? WHERE id = ?")
        .bind_all(column_id, target, now, id)
        .run();

    task.column_id = column_id;
    task.position = target;
    task.updated_at = now;
    LOGGER_DEBUG("TaskService: moved task {} to {}:{}", id, column_id, target);
    return task;
}

bool TaskService::touch_task(const std::string &id)
{
    return set_updated_at(id, format_tools::iso8601_now());
}

bool TaskService::set_updated_at(const std::string &id, const std::string &timestamp)
{
    m_db.prepare("UPDATE tasks SET updated_at = ? WHERE id = ?").bind_all(timestamp, id).run();
    return m_db.changes() > 0;
}

void TaskService::set_parent(const std::string &id, const std::optional<std::string> &parent_id)
{
    m_db.prepare("UPDATE tasks SET parent_task_id = ? WHERE id = ?").bind_all(parent_id, id).run();
}

bool TaskService::delete_task(const std::string &id)
{
    auto task = get_task(id);
    if (!task)
        return false;
    m_db.prepare("UPDATE tags SET usage_count = MAX(usage_count - 1, 0) "
                 "WHERE id IN (SELECT tag_id FROM task_tags WHERE task_id = ?)")
        .bind(1, id)
        .run();
    m_db.prepare("DELETE FROM task_tags WHERE task_id = ?").bind(1, id).run();
    m_db.prepare("DELETE FROM tasks WHERE id = ?").bind(1, id).run();
    shift_for_removal(task->column_id, task->position);
    LOGGER_DEBUG("TaskService: deleted task {}", id);
    return true;
}

void TaskService::restore_task(const Task &snapshot)
{
    if (get_task(snapshot.id))
        return;
    shift_for_insertion(snapshot.column_id, snapshot.position);
    m_db.prepare("INSERT INTO tasks (id, board_id, column_id, parent_task_id, title, description, position, "
                 "priority, due_date, created_at, updated_at, archived) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)")
        .bind_all(snapshot.id, snapshot.board_id, snapshot.column_id, snapshot.parent_task_id, snapshot.title,
                  snapshot.description, snapshot.position, snapshot.priority, snapshot.due_date,
                  snapshot.created_at, snapshot.updated_at, snapshot.archived)
        .run();
    LOGGER_DEBUG("TaskService: restored task {}", snapshot.id);
}

} // namespace kanbanhub::store
