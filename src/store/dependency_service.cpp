#include "store/dependency_service.hpp"

#include "utils/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kDependencyColumns = "id, task_id, depends_on_task_id, dependency_type, created_at";

TaskDependency read_dependency(const Statement &st)
{
    return TaskDependency{.id = st.column_text(0),
                          .task_id = st.column_text(1),
                          .depends_on_task_id = st.column_text(2),
                          .dependency_type = st.column_text(3),
                          .created_at = st.column_text(4)};
}

bool is_valid_type(const std::string &type)
{
    return type == "blocks" || type == "related" || type == "parent-child";
}

} // namespace

TaskDependency DependencyService::add_dependency(const std::string &task_id,
                                                 const std::string &depends_on_task_id,
                                                 const std::string &dependency_type)
{
    if (task_id == depends_on_task_id)
        throw ValidationError(fmt::format("Task {} cannot depend on itself", task_id));
    if (!is_valid_type(dependency_type))
        throw ValidationError(fmt::format("Unknown dependency type '{}'", dependency_type));

    for (const auto *id : {&task_id, &depends_on_task_id})
    {
        auto st = m_db.prepare("SELECT 1 FROM tasks WHERE id = ?");
        st.bind(1, *id);
        if (!st.step())
            throw NotFoundError("Task", *id);
    }

    if (is_reachable(depends_on_task_id, task_id))
        throw ValidationError(fmt::format("Dependency {} -> {} would create a cycle", task_id,
                                          depends_on_task_id));

    TaskDependency dep{.id = uid::generate_uuid(),
                       .task_id = task_id,
                       .depends_on_task_id = depends_on_task_id,
                       .dependency_type = dependency_type,
                       .created_at = format_tools::iso8601_now()};
    m_db.prepare("INSERT INTO task_dependencies (id, task_id, depends_on_task_id, dependency_type, created_at) "
                 "VALUES (?, ?, ?, ?, ?)")
        .bind_all(dep.id, dep.task_id, dep.depends_on_task_id, dep.dependency_type, dep.created_at)
        .run();

    LOGGER_DEBUG("DependencyService: {} now depends on {}", task_id, depends_on_task_id);
    return dep;
}

std::optional<TaskDependency> DependencyService::get_dependency(const std::string &id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM task_dependencies WHERE id = ?", kDependencyColumns));
    st.bind(1, id);
    if (!st.step())
        return std::nullopt;
    return read_dependency(st);
}

bool DependencyService::remove_dependency(const std::string &id)
{
    m_db.prepare("DELETE FROM task_dependencies WHERE id = ?").bind(1, id).run();
    return m_db.changes() > 0;
}

std::vector<TaskDependency> DependencyService::query_(const char *where, const std::string &task_id)
{
    auto st = m_db.prepare(fmt::format("SELECT {} FROM task_dependencies WHERE {} ORDER BY created_at, id",
                                       kDependencyColumns, where));
    int index = 0;
    // The WHERE clause may reference the task id once or twice.
    for (const char *p = where; *p != '\0'; ++p)
    {
        if (*p == '?')
            st.bind(++index, task_id);
    }
    std::vector<TaskDependency> deps;
    while (st.step())
        deps.push_back(read_dependency(st));
    return deps;
}

std::vector<TaskDependency> DependencyService::get_dependencies_for_task(const std::string &task_id)
{
    return query_("task_id = ? OR depends_on_task_id = ?", task_id);
}

std::vector<TaskDependency> DependencyService::get_blockers(const std::string &task_id)
{
    return query_("task_id = ?", task_id);
}

std::vector<TaskDependency> DependencyService::get_dependents(const std::string &task_id)
{
    return query_("depends_on_task_id = ?", task_id);
}

bool DependencyService::is_reachable(const std::string &from, const std::string &to)
{
    auto st = m_db.prepare("WITH RECURSIVE reach(id) AS ("
                           "  SELECT ? "
                           "  UNION "
                           "  SELECT d.depends_on_task_id FROM task_dependencies d JOIN reach r ON d.task_id = r.id"
                           ") SELECT 1 FROM reach WHERE id = ? LIMIT 1");
    st.bind_all(from, to);
    return st.step();
}

void DependencyService::restore_dependency(const TaskDependency &snapshot)
{
    if (get_dependency(snapshot.id))
        return;
    m_db.prepare("INSERT INTO task_dependencies (id, task_id, depends_on_task_id, dependency_type, created_at) "
                 "VALUES (?, ?, ?, ?, ?)")
        .bind_all(snapshot.id, snapshot.task_id, snapshot.depends_on_task_id, snapshot.dependency_type,
                  snapshot.created_at)
        .run();
    LOGGER_DEBUG("DependencyService: restored dependency {}", snapshot.id);
}

} // namespace kanbanhub::store
