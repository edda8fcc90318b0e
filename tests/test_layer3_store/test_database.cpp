/**
 * @file test_database.cpp
 * @brief Layer 3 tests for the SQLite Database: schema, transaction envelope and
 *        result-code translation.
 */
#include "kbh_store.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <sqlite3.h>

using namespace kanbanhub;
using namespace kanbanhub::store;
using namespace kanbanhub::tests::helper;
using namespace std::chrono_literals;

class DatabaseTest : public ::testing::Test
{
  protected:
    ServiceFixture fx;
};

TEST_F(DatabaseTest, SchemaIsCreatedOnOpen)
{
    for (const char *table : {"boards", "columns", "tasks", "task_dependencies", "notes", "tags", "task_tags"})
    {
        EXPECT_EQ(fx.count_rows("sqlite_master", "type = 'table' AND name = ?", table), 1) << table;
    }
}

TEST_F(DatabaseTest, ForeignKeysAreEnforced)
{
    auto st = fx.db.prepare("PRAGMA foreign_keys");
    ASSERT_TRUE(st.step());
    EXPECT_EQ(st.column_int(0), 1);

    EXPECT_THROW(fx.db.prepare("INSERT INTO columns (id, board_id, name, position, color, created_at) "
                               "VALUES ('c1', 'no-such-board', 'Todo', 0, '#000000', 'now')")
                     .run(),
                 ValidationError);
}

TEST_F(DatabaseTest, DuplicateBoardNameIsConflict)
{
    fx.boards.create_board({.name = "Sprint"});
    EXPECT_THROW(fx.boards.create_board({.name = "Sprint"}), ConflictError);
    EXPECT_EQ(fx.count_rows("boards"), 1);
}

TEST_F(DatabaseTest, TransactionCommitsOnSuccess)
{
    fx.db.transaction([&] { fx.boards.create_board({.name = "Committed"}); });
    EXPECT_FALSE(fx.db.in_transaction());
    EXPECT_EQ(fx.count_rows("boards", "name = ?", "Committed"), 1);
}

TEST_F(DatabaseTest, TransactionRollsBackAndRethrows)
{
    EXPECT_THROW(fx.db.transaction(
                     [&]
                     {
                         fx.boards.create_board({.name = "Doomed"});
                         throw std::runtime_error("boom");
                     }),
                 std::runtime_error);
    EXPECT_FALSE(fx.db.in_transaction());
    EXPECT_EQ(fx.count_rows("boards"), 0);
    EXPECT_EQ(fx.count_rows("columns"), 0);
}

TEST_F(DatabaseTest, TransactionRollsBackAfterFailedStatement)
{
    fx.boards.create_board({.name = "Taken"});
    EXPECT_THROW(fx.db.transaction(
                     [&]
                     {
                         fx.boards.create_board({.name = "Fresh"});
                         fx.boards.create_board({.name = "Taken"});
                     }),
                 ConflictError);
    EXPECT_EQ(fx.count_rows("boards", "name = ?", "Fresh"), 0);
}

TEST_F(DatabaseTest, NestedTransactionIsRejected)
{
    bool inner_ran = false;
    EXPECT_THROW(fx.db.transaction([&] { fx.db.transaction([&] { inner_ran = true; }); }), ValidationError);
    EXPECT_FALSE(inner_ran);
    EXPECT_FALSE(fx.db.in_transaction());

    // The envelope is usable again afterwards.
    EXPECT_NO_THROW(fx.db.transaction([] {}));
}

TEST_F(DatabaseTest, TransactionsFromOtherThreadsAreSerialised)
{
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&, t]
            {
                fx.db.transaction(
                    [&]
                    {
                        int now = ++inside;
                        int seen = max_inside.load();
                        while (now > seen && !max_inside.compare_exchange_weak(seen, now))
                        {
                        }
                        fx.boards.create_board({.name = fmt::format("Board {}", t)});
                        std::this_thread::sleep_for(5ms);
                        --inside;
                    });
            });
    }
    for (auto &th : threads)
        th.join();
    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(fx.count_rows("boards"), 4);
}

TEST_F(DatabaseTest, CheckTranslatesResultCodes)
{
    EXPECT_NO_THROW(fx.db.check_(SQLITE_OK, "ok"));
    EXPECT_NO_THROW(fx.db.check_(SQLITE_DONE, "done"));
    EXPECT_THROW(fx.db.check_(SQLITE_BUSY, "busy"), TransientStoreError);
    EXPECT_THROW(fx.db.check_(SQLITE_LOCKED, "locked"), TransientStoreError);
    EXPECT_THROW(fx.db.check_(SQLITE_CONSTRAINT_UNIQUE, "unique"), ConflictError);
    EXPECT_THROW(fx.db.check_(SQLITE_CONSTRAINT_FOREIGNKEY, "fk"), ValidationError);

    try
    {
        fx.db.check_(SQLITE_IOERR, "io");
        FAIL() << "expected StoreError";
    }
    catch (const TransientStoreError &)
    {
        FAIL() << "I/O errors are not transient";
    }
    catch (const StoreError &e)
    {
        EXPECT_EQ(e.store_code() & 0xff, SQLITE_IOERR);
        EXPECT_EQ(e.code(), "DATABASE_ERROR");
    }
}

TEST(DatabaseFileTest, LockContentionIsTransient)
{
    auto path = unique_temp_path("db_busy", ".db");
    {
        Database holder({.path = path.string(), .busy_timeout = 0ms, .wal = false});
        Database contender({.path = path.string(), .busy_timeout = 0ms, .wal = false});

        holder.exec("BEGIN IMMEDIATE");
        EXPECT_THROW(contender.transaction([] {}), TransientStoreError);
        holder.exec("ROLLBACK");

        EXPECT_NO_THROW(contender.transaction([] {}));
    }
    remove_quietly(path);
}

TEST(DatabaseFileTest, OptionsFromConfig)
{
    auto cfg = ServiceConfig::from_json(
        {{"database", {{"path", "/tmp/somewhere.db"}, {"busy_timeout_ms", 250}, {"wal", false}}}});
    auto opts = DatabaseOptions::from_config(cfg);
    EXPECT_EQ(opts.path, "/tmp/somewhere.db");
    EXPECT_EQ(opts.busy_timeout, 250ms);
    EXPECT_FALSE(opts.wal);
}
