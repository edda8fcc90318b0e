#pragma once
/**
 * @file dependency_service.hpp
 * @brief Task-to-task dependency edges.
 *
 * An edge (task_id -> depends_on_task_id) means task_id waits for depends_on_task_id.
 * The graph is kept acyclic: add_dependency refuses an edge that would close a cycle.
 */
#include <optional>
#include <string>
#include <vector>

#include "store/database.hpp"
#include "store/models.hpp"

namespace kanbanhub::store
{

class DependencyService
{
  public:
    explicit DependencyService(Database &db) : m_db(db) {}

    /**
     * @throws ValidationError on a self-dependency, an unknown type, or a cycle.
     * @throws NotFoundError if either task is missing.
     * @throws ConflictError if the edge already exists.
     */
    TaskDependency add_dependency(const std::string &task_id, const std::string &depends_on_task_id,
                                  const std::string &dependency_type = "blocks");

    std::optional<TaskDependency> get_dependency(const std::string &id);

    /// @return false if no such edge existed.
    bool remove_dependency(const std::string &id);

    /// Every edge that touches @p task_id, in either direction.
    std::vector<TaskDependency> get_dependencies_for_task(const std::string &task_id);

    /// Edges where @p task_id is the blocked side.
    std::vector<TaskDependency> get_blockers(const std::string &task_id);

    /// Tasks that wait for @p task_id.
    std::vector<TaskDependency> get_dependents(const std::string &task_id);

    /// True if @p to is reachable from @p from by following depends_on edges.
    bool is_reachable(const std::string &from, const std::string &to);

    /// Re-inserts a removed edge with its original id. No-op if it already exists.
    void restore_dependency(const TaskDependency &snapshot);

  private:
    std::vector<TaskDependency> query_(const char *where, const std::string &task_id);

    Database &m_db;
};

} // namespace kanbanhub::store
