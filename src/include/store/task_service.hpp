#pragma once
/**
 * @file task_service.hpp
 * @brief Tasks: creation, lookup, moves with position bookkeeping, deletion and restore.
 *
 * Positions are 0-based and dense within a column. Every insert, removal and move shifts
 * the neighbouring tasks so that the column stays gap-free.
 */
#include <optional>
#include <string>
#include <vector>

#include "store/database.hpp"
#include "store/models.hpp"

namespace kanbanhub::store
{

class TaskService
{
  public:
    explicit TaskService(Database &db) : m_db(db) {}

    /**
     * @brief Inserts a task at the requested position (shifting later tasks down) or at
     *        the end of its column.
     * @throws ValidationError if title, board_id or column_id is missing, the column is
     *         not on the board, the priority is unknown, or the position is negative.
     * @throws NotFoundError if the column or parent task does not exist.
     */
    Task create_task(const CreateTaskRequest &request);

    std::optional<Task> get_task(const std::string &id);

    /// @throws NotFoundError
    Task require_task(const std::string &id);

    /// Direct children of @p parent_id.
    std::vector<Task> get_subtasks(const std::string &parent_id);

    /// Tasks of @p column_id ordered by position.
    std::vector<Task> get_column_tasks(const std::string &column_id);

    /**
     * @brief Moves a task to @p column_id at @p position, or to the end of the column.
     *
     * The position is clamped to the column's current length.
     * @throws NotFoundError if task or column is missing.
     * @throws ValidationError if the column is on a different board.
     */
    Task move_task(const std::string &id, const std::string &column_id, std::optional<int> position = {});

    /// Sets updated_at to now. @return false if the task does not exist.
    bool touch_task(const std::string &id);

    /// Sets updated_at to an explicit value (used when undoing a touch).
    bool set_updated_at(const std::string &id, const std::string &timestamp);

    /// Re-parents a task; std::nullopt makes it top-level.
    void set_parent(const std::string &id, const std::optional<std::string> &parent_id);

    /**
     * @brief Deletes a task with its tag links (releasing their usage counts) and closes
     *        the gap in its column.
     *
     * Subtasks, dependencies and notes follow the schema's cascade rules; callers that
     * need to preserve them detach them first.
     * @return false if the task did not exist.
     */
    bool delete_task(const std::string &id);

    /**
     * @brief Re-inserts a previously deleted task with all its original fields,
     *        reopening its slot in the column. No-op if a task with that id exists.
     */
    void restore_task(const Task &snapshot);

  private:
    int next_position(const std::string &column_id);
    void shift_for_insertion(const std::string &column_id, int position);
    void shift_for_removal(const std::string &column_id, int position);

    Database &m_db;
};

} // namespace kanbanhub::store
