/**
 * @file test_service_coordinator.cpp
 * @brief Layer 4 tests for ServiceTransactionCoordinator.
 *
 * Two set-ups are used. The "saga" coordinator sits on a RecordingStore, so the
 * services write straight through in autocommit and only compensations can undo a
 * failed saga. The "atomic" coordinator sits on the real Database, where the store
 * transaction commits or rolls back everything.
 */
#include "kbh_txn.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include <fmt/format.h>

using namespace kanbanhub;
using namespace kanbanhub::store;
using namespace kanbanhub::txn;
using namespace kanbanhub::tests::helper;
using nlohmann::json;
using namespace std::chrono_literals;

class ServiceCoordinatorTest : public ::testing::Test
{
  protected:
    ServiceFixture fx;
    DomainServices services{fx.boards, fx.tasks, fx.tags, fx.dependencies, fx.notes};

    RecordingStore recording;
    TransactionManager saga_manager{recording, utils::NoBackoff{}};
    ServiceTransactionCoordinator saga{saga_manager, services};

    TransactionManager atomic_manager{fx.db, utils::NoBackoff{}};
    ServiceTransactionCoordinator atomic{atomic_manager, services};

    Board board;
    std::vector<Column> columns;

    void SetUp() override
    {
        board = fx.boards.create_board({.name = "Existing"});
        columns = fx.boards.get_columns(board.id);
    }

    Task AddTask(const std::string &title, std::size_t column = 0,
                 std::optional<std::string> parent = std::nullopt)
    {
        return fx.tasks.create_task(
            {.title = title, .board_id = board.id, .column_id = columns.at(column).id, .parent_task_id = parent});
    }

    /// Makes any later update that advances the updated_at of a task titled @p title fail.
    void MakeUntouchable(const std::string &title)
    {
        fx.db.exec(fmt::format("CREATE TRIGGER untouchable BEFORE UPDATE ON tasks "
                               "WHEN OLD.title = '{}' AND NEW.updated_at > OLD.updated_at "
                               "BEGIN SELECT RAISE(ABORT, 'task is untouchable'); END",
                               title));
    }

    /// Makes deleting a task titled @p title fail.
    void MakeUndeletable(const std::string &title)
    {
        fx.db.exec(fmt::format("CREATE TRIGGER undeletable BEFORE DELETE ON tasks WHEN OLD.title = '{}' "
                               "BEGIN SELECT RAISE(ABORT, 'task is undeletable'); END",
                               title));
    }
};

// ============================================================================
// coordinate_multi_service_operation
// ============================================================================

TEST_F(ServiceCoordinatorTest, Coordinate_ResultsInInputOrder)
{
    std::vector<std::string> executed;
    std::vector<ServiceOperation> ops;
    for (int i = 0; i < 4; ++i)
    {
        ops.push_back({.service_name = "S",
                       .method_name = fmt::format("op{}", i),
                       .execute =
                           [&executed, i]()
                       {
                           executed.push_back(fmt::format("op{}", i));
                           return json(i * i);
                       },
                       .rollback_action = {}});
    }
    auto results = saga.coordinate_multi_service_operation(std::move(ops));
    EXPECT_EQ(results, (std::vector<json>{0, 1, 4, 9}));
    EXPECT_EQ(executed, (std::vector<std::string>{"op0", "op1", "op2", "op3"}));
    EXPECT_EQ(recording.commits(), 1);
}

TEST_F(ServiceCoordinatorTest, Coordinate_FailureCompensatesStartedStepsInReverse)
{
    std::vector<std::string> undone;
    bool later_ran = false;
    auto step = [&undone](const std::string &name, bool fail)
    {
        return ServiceOperation{.service_name = "S",
                                .method_name = name,
                                .execute = [fail]() -> json
                                {
                                    if (fail)
                                        throw ValidationError("step failed");
                                    return nullptr;
                                },
                                .rollback_action = [&undone, name]() { undone.push_back(name); }};
    };
    std::vector<ServiceOperation> ops{step("a", false), step("b", false), step("c", true)};
    ops.push_back({.service_name = "S",
                   .method_name = "d",
                   .execute =
                       [&later_ran]()
                   {
                       later_ran = true;
                       return json(nullptr);
                   },
                   .rollback_action = [&undone]() { undone.push_back("d"); }});

    try
    {
        saga.coordinate_multi_service_operation(std::move(ops));
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        ASSERT_EQ(failure.operations().size(), 3u);
        EXPECT_EQ(failure.operations()[2].method_name, "c");
        EXPECT_THROW(failure.rethrow_cause(), ValidationError);
    }
    EXPECT_FALSE(later_ran);
    // The failing step's own compensation runs too: it was registered before it executed.
    EXPECT_EQ(undone, (std::vector<std::string>{"c", "b", "a"}));
}

TEST_F(ServiceCoordinatorTest, Coordinate_MissingExecuteRejectedUpFront)
{
    std::vector<ServiceOperation> ops{{.service_name = "S", .method_name = "nothing"}};
    EXPECT_THROW(saga.coordinate_multi_service_operation(std::move(ops)), ValidationError);
    EXPECT_EQ(recording.begins(), 0);
}

TEST_F(ServiceCoordinatorTest, Coordinate_EmptyListCommits)
{
    EXPECT_TRUE(saga.coordinate_multi_service_operation({}).empty());
    EXPECT_EQ(recording.commits(), 1);
}

// ============================================================================
// create_board
// ============================================================================

TEST_F(ServiceCoordinatorTest, CreateBoard_WithTasksAndTags)
{
    auto result = atomic.create_board({.name = "Sprint 1"}, {{.title = "T1"}, {.title = "T2"}}, {{.name = "urgent"}});

    EXPECT_EQ(result.board.name, "Sprint 1");
    auto board_columns = fx.boards.get_columns(result.board.id);
    ASSERT_EQ(board_columns.size(), 3u);

    ASSERT_EQ(result.tasks.size(), 2u);
    EXPECT_EQ(result.tasks[0].title, "T1");
    EXPECT_EQ(result.tasks[1].title, "T2");
    for (std::size_t i = 0; i < result.tasks.size(); ++i)
    {
        EXPECT_EQ(result.tasks[i].board_id, result.board.id);
        EXPECT_EQ(result.tasks[i].column_id, board_columns[0].id);
        EXPECT_EQ(result.tasks[i].position, static_cast<int>(i));
    }

    ASSERT_EQ(result.tags.size(), 1u);
    EXPECT_EQ(result.tags[0].name, "urgent");
    EXPECT_EQ(result.tags[0].usage_count, 0);
    EXPECT_EQ(fx.count_rows("task_tags"), 0) << "seed tags are not linked";
    EXPECT_EQ(atomic_manager.active_transaction_count(), 0u);
}

TEST_F(ServiceCoordinatorTest, CreateBoard_CompensatedWhenTagCreationFails)
{
    fx.tags.create_tag({.name = "urgent"});
    const int boards_before = fx.count_rows("boards");

    try
    {
        saga.create_board({.name = "Sprint 1"}, {{.title = "T1"}, {.title = "T2"}}, {{.name = "urgent"}});
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        EXPECT_THROW(failure.rethrow_cause(), ConflictError);
        ASSERT_EQ(failure.operations().size(), 4u);
        EXPECT_EQ(failure.operations()[0].method_name, "createBoard");
        EXPECT_EQ(failure.operations()[3].method_name, "createTag");
    }

    EXPECT_EQ(recording.rollbacks(), 1);
    EXPECT_EQ(fx.count_rows("boards"), boards_before);
    EXPECT_EQ(fx.count_rows("boards", "name = ?", "Sprint 1"), 0);
    EXPECT_EQ(fx.count_rows("tasks"), 0);
    EXPECT_EQ(fx.count_rows("columns"), 3) << "only the existing board's columns remain";
    EXPECT_EQ(fx.count_rows("tags"), 1);
}

TEST_F(ServiceCoordinatorTest, CreateBoard_AtomicFailureLeavesNothing)
{
    EXPECT_THROW(atomic.create_board({.name = "Sprint 2"}, {{.title = ""}}), TransactionFailure);
    EXPECT_EQ(fx.count_rows("boards", "name = ?", "Sprint 2"), 0);
}

TEST_F(ServiceCoordinatorTest, CreateBoard_DuplicateNameFailsFirstStep)
{
    try
    {
        saga.create_board({.name = "Existing"}, {{.title = "T1"}});
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        EXPECT_EQ(failure.operations().size(), 1u);
    }
    EXPECT_EQ(fx.count_rows("boards"), 1);
    EXPECT_TRUE(fx.boards.get_board(board.id).has_value()) << "the existing board is untouched";
}

// ============================================================================
// move_task_with_dependencies
// ============================================================================

TEST_F(ServiceCoordinatorTest, Move_TouchesDependents)
{
    auto a = AddTask("A");
    auto b = AddTask("B");
    auto c = AddTask("C");
    fx.dependencies.add_dependency(b.id, a.id); // B waits for A
    fx.dependencies.add_dependency(a.id, c.id); // A waits for C
    fx.tasks.set_updated_at(b.id, "2020-01-01T00:00:00.000Z");
    fx.tasks.set_updated_at(c.id, "2020-01-01T00:00:00.000Z");

    auto result = atomic.move_task_with_dependencies(a.id, columns[1].id);
    EXPECT_EQ(result.moved_task.column_id, columns[1].id);
    EXPECT_EQ(result.moved_task.position, 0);
    EXPECT_EQ(result.updated_dependencies.size(), 2u);

    EXPECT_NE(fx.tasks.require_task(b.id).updated_at, "2020-01-01T00:00:00.000Z") << "dependent touched";
    EXPECT_EQ(fx.tasks.require_task(c.id).updated_at, "2020-01-01T00:00:00.000Z") << "blocker untouched";
    EXPECT_EQ(fx.tasks.require_task(b.id).position, 0);
}

TEST_F(ServiceCoordinatorTest, Move_ToOtherBoardRejected)
{
    auto a = AddTask("A");
    auto other = fx.boards.create_board({.name = "Other"});
    auto other_column = fx.boards.get_columns(other.id)[0];

    try
    {
        saga.move_task_with_dependencies(a.id, other_column.id);
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        EXPECT_THROW(failure.rethrow_cause(), ValidationError);
    }
    auto unchanged = fx.tasks.require_task(a.id);
    EXPECT_EQ(unchanged.column_id, columns[0].id);
    EXPECT_EQ(unchanged.updated_at, a.updated_at);
}

TEST_F(ServiceCoordinatorTest, Move_MissingTaskOrColumn)
{
    auto a = AddTask("A");
    EXPECT_THROW(saga.move_task_with_dependencies("missing", columns[1].id), TransactionFailure);
    EXPECT_THROW(saga.move_task_with_dependencies(a.id, "missing"), TransactionFailure);
}

TEST_F(ServiceCoordinatorTest, Move_CompensatedWhenTouchingDependentFails)
{
    auto a = AddTask("A");
    auto fragile = AddTask("Fragile");
    fx.dependencies.add_dependency(fragile.id, a.id);
    fx.tasks.set_updated_at(fragile.id, "2020-01-01T00:00:00.000Z");
    fx.tasks.set_updated_at(a.id, "2020-01-01T00:00:00.000Z");
    MakeUntouchable("Fragile");

    try
    {
        saga.move_task_with_dependencies(a.id, columns[2].id);
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        EXPECT_THROW(failure.rethrow_cause(), StoreError);
        EXPECT_EQ(failure.operations().size(), 3u);
    }

    auto restored = fx.tasks.require_task(a.id);
    EXPECT_EQ(restored.column_id, columns[0].id);
    EXPECT_EQ(restored.position, 0);
    EXPECT_EQ(restored.updated_at, "2020-01-01T00:00:00.000Z");
    EXPECT_EQ(fx.tasks.require_task(fragile.id).position, 1);
    EXPECT_EQ(fx.tasks.require_task(fragile.id).updated_at, "2020-01-01T00:00:00.000Z");
    EXPECT_TRUE(fx.tasks.get_column_tasks(columns[2].id).empty());
}

// ============================================================================
// delete_task_cascade
// ============================================================================

class DeleteCascadeTest : public ServiceCoordinatorTest
{
  protected:
    Task blocker, parent, target, child1, child2, waiter;
    Tag urgent;

    void SetUp() override
    {
        ServiceCoordinatorTest::SetUp();
        blocker = AddTask("Blocker");
        parent = AddTask("Parent");
        target = AddTask("Target", 0, parent.id);
        child1 = AddTask("Child 1", 1, target.id);
        child2 = AddTask("Child 2", 1, target.id);
        waiter = AddTask("Waiter");
        fx.dependencies.add_dependency(target.id, blocker.id);
        fx.dependencies.add_dependency(waiter.id, target.id);
        fx.notes.create_note({.task_id = target.id, .board_id = board.id, .content = "why"});
        fx.notes.create_note({.task_id = target.id, .board_id = board.id, .content = "how", .pinned = true});
        urgent = fx.tags.create_tag({.name = "urgent"});
        fx.tags.add_tag_to_task(target.id, urgent.id);
    }
};

TEST_F(DeleteCascadeTest, DetachesAndDeletes)
{
    auto result = atomic.delete_task_cascade(target.id);

    EXPECT_EQ(result.deleted_task.id, target.id);
    EXPECT_EQ(result.deleted_notes.size(), 2u);
    EXPECT_EQ(result.removed_dependencies.size(), 2u);
    ASSERT_EQ(result.orphaned_subtasks.size(), 2u);
    for (const auto &sub : result.orphaned_subtasks)
        EXPECT_EQ(sub.parent_task_id, parent.id);

    EXPECT_FALSE(fx.tasks.get_task(target.id).has_value());
    EXPECT_EQ(fx.tasks.require_task(child1.id).parent_task_id, parent.id) << "subtasks survive, re-parented";
    EXPECT_EQ(fx.tasks.require_task(child2.id).parent_task_id, parent.id);
    EXPECT_EQ(fx.count_rows("notes"), 0);
    EXPECT_EQ(fx.count_rows("task_dependencies"), 0);
    EXPECT_EQ(fx.tags.get_tag(urgent.id)->usage_count, 0);
    EXPECT_EQ(fx.tasks.require_task(waiter.id).position, 2) << "column closed the gap";
}

TEST_F(DeleteCascadeTest, TopLevelTaskOrphansBecomeTopLevel)
{
    auto top = AddTask("Top");
    auto sub = AddTask("Sub", 0, top.id);
    auto result = atomic.delete_task_cascade(top.id);
    ASSERT_EQ(result.orphaned_subtasks.size(), 1u);
    EXPECT_FALSE(fx.tasks.require_task(sub.id).parent_task_id.has_value());
}

TEST_F(DeleteCascadeTest, MissingTaskChangesNothing)
{
    EXPECT_THROW(saga.delete_task_cascade("missing"), TransactionFailure);
    EXPECT_EQ(fx.count_rows("tasks"), 6);
    EXPECT_EQ(fx.count_rows("notes"), 2);
}

TEST_F(DeleteCascadeTest, CompensatedWhenDeleteFails)
{
    MakeUndeletable("Target");

    try
    {
        saga.delete_task_cascade(target.id);
        FAIL() << "expected TransactionFailure";
    }
    catch (const TransactionFailure &failure)
    {
        EXPECT_THROW(failure.rethrow_cause(), StoreError);
        ASSERT_EQ(failure.operations().size(), 5u);
        EXPECT_EQ(failure.operations().back().method_name, "deleteTask");
    }

    EXPECT_TRUE(fx.tasks.get_task(target.id).has_value());
    EXPECT_EQ(fx.tasks.require_task(child1.id).parent_task_id, target.id);
    EXPECT_EQ(fx.tasks.require_task(child2.id).parent_task_id, target.id);
    EXPECT_EQ(fx.notes.get_task_notes(target.id).size(), 2u);
    EXPECT_EQ(fx.dependencies.get_blockers(target.id).size(), 1u);
    EXPECT_EQ(fx.dependencies.get_dependents(target.id).size(), 1u);

    auto tags = fx.tags.get_task_tags(target.id);
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].usage_count, 1);
}

// ============================================================================
// bulk_create_tasks
// ============================================================================

TEST_F(ServiceCoordinatorTest, Bulk_CreatesChainAndTags)
{
    auto urgent = fx.tags.create_tag({.name = "urgent"});
    auto backend = fx.tags.create_tag({.name = "backend"});
    std::vector<CreateTaskRequest> requests{{.title = "Design", .board_id = board.id},
                                            {.title = "Build", .board_id = board.id},
                                            {.title = "Ship", .board_id = board.id, .column_id = columns[1].id}};

    auto result = atomic.bulk_create_tasks(
        requests, {.assign_tags = {urgent.id, backend.id}, .create_dependencies = true});

    ASSERT_EQ(result.tasks.size(), 3u);
    EXPECT_EQ(result.tasks[0].column_id, columns[0].id) << "defaults to the first column";
    EXPECT_EQ(result.tasks[2].column_id, columns[1].id);

    ASSERT_EQ(result.created_dependencies.size(), 2u);
    EXPECT_EQ(result.created_dependencies[0].task_id, result.tasks[1].id);
    EXPECT_EQ(result.created_dependencies[0].depends_on_task_id, result.tasks[0].id);
    EXPECT_EQ(result.created_dependencies[1].task_id, result.tasks[2].id);
    EXPECT_EQ(result.created_dependencies[1].depends_on_task_id, result.tasks[1].id);

    EXPECT_EQ(result.assigned_tags.size(), 6u);
    EXPECT_EQ(fx.tags.get_tag(urgent.id)->usage_count, 3);
    EXPECT_EQ(fx.tags.get_tag(backend.id)->usage_count, 3);
}

TEST_F(ServiceCoordinatorTest, Bulk_NoDependenciesUnlessAsked)
{
    auto result = atomic.bulk_create_tasks({{.title = "One", .board_id = board.id}, {.title = "Two", .board_id = board.id}});
    EXPECT_EQ(result.tasks.size(), 2u);
    EXPECT_TRUE(result.created_dependencies.empty());
    EXPECT_TRUE(result.assigned_tags.empty());
}

TEST_F(ServiceCoordinatorTest, Bulk_CompensatedWhenTagIsMissing)
{
    auto urgent = fx.tags.create_tag({.name = "urgent"});
    std::vector<CreateTaskRequest> requests{{.title = "One", .board_id = board.id},
                                            {.title = "Two", .board_id = board.id}};

    EXPECT_THROW(saga.bulk_create_tasks(requests, {.assign_tags = {urgent.id, "missing-tag"}}), TransactionFailure);
    EXPECT_EQ(fx.count_rows("tasks"), 0);
    EXPECT_EQ(fx.count_rows("task_tags"), 0);
    EXPECT_EQ(fx.tags.get_tag(urgent.id)->usage_count, 0);
}

// ============================================================================
// Timeout during a composite
// ============================================================================

TEST(ServiceCoordinatorTimeoutTest, StepFinishingAfterRollbackUndoesItsEffect)
{
    auto path = unique_temp_path("saga_timeout", ".db");
    {
        Database db({.path = path.string(), .busy_timeout = 2000ms, .wal = false});
        Database holder({.path = path.string(), .busy_timeout = 0ms, .wal = false});
        BoardService boards{db};
        TaskService tasks{db};
        TagService tags{db};
        DependencyService dependencies{db};
        NoteService notes{db};
        RecordingStore recording;
        TransactionManager manager{recording, utils::NoBackoff{}};
        ServiceTransactionCoordinator coordinator{manager, DomainServices{boards, tasks, tags, dependencies, notes}};

        auto board = boards.create_board({.name = "Locked"});
        db.exec("CREATE TABLE deleted_tasks (id TEXT NOT NULL)");
        db.exec("CREATE TRIGGER log_task_delete AFTER DELETE ON tasks "
                "BEGIN INSERT INTO deleted_tasks (id) VALUES (OLD.id); END");
        auto count = [&db](const char *table)
        {
            auto st = db.prepare(fmt::format("SELECT COUNT(*) FROM {}", table));
            st.step();
            return st.column_int(0);
        };

        // The first insert waits on the holder's write lock well past the deadline.
        holder.exec("BEGIN IMMEDIATE");
        std::thread release(
            [&holder]
            {
                std::this_thread::sleep_for(200ms);
                holder.exec("COMMIT");
            });

        TransactionOptions options;
        options.timeout = 50ms;
        try
        {
            coordinator.bulk_create_tasks({{.title = "A", .board_id = board.id}, {.title = "B", .board_id = board.id}},
                                          {.create_dependencies = true}, options);
            FAIL() << "expected TransactionFailure";
        }
        catch (const TransactionFailure &failure)
        {
            EXPECT_TRUE(failure.timed_out());
        }
        release.join();

        // The abandoned step lands its insert after compensation began, so it deletes
        // the task itself.
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (count("deleted_tasks") == 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(10ms);
        EXPECT_EQ(count("deleted_tasks"), 1);
        EXPECT_EQ(count("tasks"), 0);
        EXPECT_EQ(count("task_dependencies"), 0);

        // Let the worker unwind before the services go away.
        std::this_thread::sleep_for(100ms);
    }
    remove_quietly(path);
}

// ============================================================================
// Metrics
// ============================================================================

TEST_F(ServiceCoordinatorTest, Metrics_ReflectLiveTransactions)
{
    auto idle = saga.get_transaction_metrics();
    EXPECT_EQ(idle.active_transactions, 0u);
    EXPECT_EQ(idle.avg_operations_per_transaction, 0.0);

    TransactionMetrics during;
    std::vector<ServiceOperation> ops{
        {.service_name = "S", .method_name = "first", .execute = [] { return json(nullptr); }},
        {.service_name = "S",
         .method_name = "second",
         .execute =
             [&]
         {
             during = saga.get_transaction_metrics();
             return json(nullptr);
         }}};
    saga.coordinate_multi_service_operation(std::move(ops));

    EXPECT_EQ(during.active_transactions, 1u);
    EXPECT_EQ(during.total_operations, 2u);
    EXPECT_DOUBLE_EQ(during.avg_operations_per_transaction, 2.0);

    json j = during;
    EXPECT_EQ(j["active_transactions"], 1);
    EXPECT_EQ(j["total_operations"], 2);
}
