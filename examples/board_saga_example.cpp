/**
 * @file board_saga_example.cpp
 * @brief Example: composite board operations run as compensated transactions.
 *
 * Wires the whole stack together: layered configuration, the logger, the SQLite
 * store, the five domain services, a TransactionManager and the coordinator.
 *
 * Key concepts shown:
 *  - create_board() with seed tasks and tags as one transaction.
 *  - bulk_create_tasks() chaining the new tasks with dependencies.
 *  - move_task_with_dependencies() and delete_task_cascade().
 *  - A failing saga: the caller gets a TransactionFailure carrying the operation
 *    list, and nothing of the saga is left behind.
 *  - A method wrapped by the transaction decorator.
 *
 * Usage:
 *   board_saga_example [config.json]
 *
 * Without an argument the config is taken from KANBANHUB_CONFIG_FILE, else the
 * built-in defaults (database file "kanban.db" in the working directory).
 */
#include "kbh_txn.hpp"

#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

using namespace kanbanhub;
using namespace kanbanhub::store;
using namespace kanbanhub::txn;

namespace
{

void print_board(BoardService &boards, TaskService &tasks, const std::string &board_id)
{
    for (const auto &column : boards.get_columns(board_id))
    {
        std::cout << "  [" << column.name << "]\n";
        for (const auto &task : tasks.get_column_tasks(column.id))
            std::cout << "    " << task.position << ". " << task.title << " (" << task.priority << ")\n";
    }
}

/// A caller-side service method that takes the ambient transaction as its last argument.
class Triage
{
  public:
    Triage(TransactionManager &manager, TaskService &tasks, TagService &tags)
        : m_manager(manager), m_tasks(tasks), m_tags(tags)
    {
    }

    TaskTag flag(const std::string &task_id, const std::string &tag_id, TransactionContext &context)
    {
        m_manager.add_operation(context, "TagService", "addTagToTask");
        m_manager.add_rollback_action(context, [this, task_id, tag_id] { m_tags.remove_tag_from_task(task_id, tag_id); });
        m_tasks.require_task(task_id);
        return m_tags.add_tag_to_task(task_id, tag_id);
    }

  private:
    TransactionManager &m_manager;
    TaskService &m_tasks;
    TagService &m_tags;
};

} // namespace

int main(int argc, char **argv)
{
    try
    {
        auto config = ServiceConfig::load(argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path{});
        if (!config.apply_logging())
            std::cerr << "Could not open log file '" << config.log_file() << "', logging to console\n";

        Database db(DatabaseOptions::from_config(config));
        BoardService boards(db);
        TaskService tasks(db);
        TagService tags(db);
        DependencyService dependencies(db);
        NoteService notes(db);

        TransactionManager manager(db, config.retry_backoff());
        ServiceTransactionCoordinator coordinator(manager, {boards, tasks, tags, dependencies, notes});
        const auto options = TransactionOptions::from_config(config);

        // Board names are unique; a suffix keeps repeated runs on one file apart.
        const auto suffix = uid::generate_uuid().substr(0, 8);

        // ── 1. Board with seed tasks and tags ───────────────────────────────
        auto created = coordinator.create_board({.name = fmt::format("Sprint {}", suffix)},
                                                {{.title = "Write schema", .priority = "high"},
                                                 {.title = "Review schema"}},
                                                {{.name = fmt::format("urgent-{}", suffix), .color = "#dc2626"}},
                                                options);
        std::cout << "Created board '" << created.board.name << "' with " << created.tasks.size()
                  << " tasks and " << created.tags.size() << " tags\n";

        // ── 2. Bulk tasks chained by dependencies ───────────────────────────
        auto bulk = coordinator.bulk_create_tasks({{.title = "Design API", .board_id = created.board.id},
                                                   {.title = "Implement API", .board_id = created.board.id},
                                                   {.title = "Document API", .board_id = created.board.id}},
                                                  {.assign_tags = {created.tags[0].id}, .create_dependencies = true},
                                                  options);
        std::cout << "Bulk-created " << bulk.tasks.size() << " tasks with " << bulk.created_dependencies.size()
                  << " dependencies\n";

        // ── 3. Move a task; its dependents are touched ──────────────────────
        const auto columns = boards.get_columns(created.board.id);
        auto moved = coordinator.move_task_with_dependencies(bulk.tasks[0].id, columns[1].id, 0, options);
        std::cout << "Moved '" << moved.moved_task.title << "' to " << columns[1].name << " ("
                  << moved.updated_dependencies.size() << " dependency edges)\n";

        // ── 4. Delete a task with its notes and dependencies ────────────────
        notes.create_note({.task_id = bulk.tasks[1].id,
                           .board_id = created.board.id,
                           .title = "Decision",
                           .content = "Use cursor pagination",
                           .category = "implementation"});
        auto deleted = coordinator.delete_task_cascade(bulk.tasks[1].id, options);
        std::cout << "Deleted '" << deleted.deleted_task.title << "' (" << deleted.deleted_notes.size()
                  << " notes, " << deleted.removed_dependencies.size() << " dependencies)\n";

        // ── 5. A saga that fails half-way ───────────────────────────────────
        try
        {
            // The tag name is taken, so the last step fails.
            coordinator.create_board({.name = fmt::format("Doomed {}", suffix)}, {{.title = "Never kept"}},
                                     {{.name = created.tags[0].name}}, options);
        }
        catch (const TransactionFailure &failure)
        {
            std::cout << "Saga " << failure.transaction_id() << " failed: " << failure.what() << "\n";
            for (const auto &op : failure.operations())
                std::cout << "  " << op.service_name << "." << op.method_name << " -> " << to_string(op.status)
                          << "\n";
        }

        // ── 6. Decorated method ─────────────────────────────────────────────
        Triage triage(manager, tasks, tags);
        auto flag = create_transaction_decorator(coordinator, options).wrap(triage, &Triage::flag);
        flag(created.tasks[1].id, created.tags[0].id);
        std::cout << "Flagged '" << created.tasks[1].title << "' as " << created.tags[0].name << "\n";

        std::cout << "\nBoard '" << created.board.name << "':\n";
        print_board(boards, tasks, created.board.id);

        nlohmann::json metrics = coordinator.get_transaction_metrics();
        std::cout << "Transaction metrics: " << metrics.dump() << "\n";
    }
    catch (const KanbanError &e)
    {
        LOGGER_ERROR("board_saga_example: {} ({})", e.what(), e.code());
        utils::Logger::instance().shutdown();
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("board_saga_example: {}", e.what());
        utils::Logger::instance().shutdown();
        return EXIT_FAILURE;
    }

    utils::Logger::instance().shutdown();
    return EXIT_SUCCESS;
}
