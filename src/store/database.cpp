/**
 * @file database.cpp
 * @brief SQLite connection, schema and error translation.
 */
#include "store/database.hpp"

#include <sqlite3.h>

#include <utility>

#include <fmt/format.h>

#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"
#include "utils/service_config.hpp"

namespace kanbanhub::store
{

namespace
{

constexpr const char *kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS boards (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL UNIQUE,
    description TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL,
    archived    INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS columns (
    id         TEXT PRIMARY KEY,
    board_id   TEXT NOT NULL,
    name       TEXT NOT NULL,
    position   INTEGER NOT NULL,
    color      TEXT NOT NULL DEFAULT '#6b7280',
    created_at TEXT NOT NULL,
    FOREIGN KEY (board_id) REFERENCES boards(id) ON DELETE CASCADE,
    UNIQUE(board_id, position),
    UNIQUE(board_id, name)
);

CREATE TABLE IF NOT EXISTS tasks (
    id             TEXT PRIMARY KEY,
    board_id       TEXT NOT NULL,
    column_id      TEXT NOT NULL,
    parent_task_id TEXT NULL,
    title          TEXT NOT NULL,
    description    TEXT NOT NULL DEFAULT '',
    position       INTEGER NOT NULL,
    priority       TEXT NOT NULL DEFAULT 'medium' CHECK(priority IN ('low', 'medium', 'high')),
    due_date       TEXT NULL,
    created_at     TEXT NOT NULL,
    updated_at     TEXT NOT NULL,
    archived       INTEGER NOT NULL DEFAULT 0,
    FOREIGN KEY (board_id) REFERENCES boards(id) ON DELETE CASCADE,
    FOREIGN KEY (column_id) REFERENCES columns(id) ON DELETE RESTRICT,
    FOREIGN KEY (parent_task_id) REFERENCES tasks(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS task_dependencies (
    id                 TEXT PRIMARY KEY,
    task_id            TEXT NOT NULL,
    depends_on_task_id TEXT NOT NULL,
    dependency_type    TEXT NOT NULL DEFAULT 'blocks'
                       CHECK(dependency_type IN ('blocks', 'related', 'parent-child')),
    created_at         TEXT NOT NULL,
    FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE,
    FOREIGN KEY (depends_on_task_id) REFERENCES tasks(id) ON DELETE CASCADE,
    UNIQUE(task_id, depends_on_task_id),
    CHECK(task_id != depends_on_task_id)
);

CREATE TABLE IF NOT EXISTS notes (
    id         TEXT PRIMARY KEY,
    task_id    TEXT NULL,
    board_id   TEXT NOT NULL,
    title      TEXT NOT NULL DEFAULT '',
    content    TEXT NOT NULL,
    category   TEXT NOT NULL DEFAULT 'general'
               CHECK(category IN ('implementation', 'research', 'blocker', 'idea', 'general')),
    pinned     INTEGER NOT NULL DEFAULT 0,
    author     TEXT NOT NULL DEFAULT 'system',
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL,
    FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE,
    FOREIGN KEY (board_id) REFERENCES boards(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS tags (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL UNIQUE,
    slug        TEXT NOT NULL UNIQUE,
    parent_id   TEXT NULL,
    path        TEXT NOT NULL,
    color       TEXT NOT NULL DEFAULT '#6b7280',
    description TEXT NOT NULL DEFAULT '',
    usage_count INTEGER NOT NULL DEFAULT 0,
    created_at  TEXT NOT NULL,
    FOREIGN KEY (parent_id) REFERENCES tags(id) ON DELETE SET NULL
);

CREATE TABLE IF NOT EXISTS task_tags (
    task_id    TEXT NOT NULL,
    tag_id     TEXT NOT NULL,
    created_at TEXT NOT NULL,
    PRIMARY KEY (task_id, tag_id),
    FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE,
    FOREIGN KEY (tag_id) REFERENCES tags(id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_tasks_column_position ON tasks(column_id, position);
CREATE INDEX IF NOT EXISTS idx_tasks_parent ON tasks(parent_task_id);
CREATE INDEX IF NOT EXISTS idx_dependencies_task ON task_dependencies(task_id);
CREATE INDEX IF NOT EXISTS idx_dependencies_depends_on ON task_dependencies(depends_on_task_id);
CREATE INDEX IF NOT EXISTS idx_notes_task ON notes(task_id);
CREATE INDEX IF NOT EXISTS idx_task_tags_tag ON task_tags(tag_id);
)SQL";

bool is_memory_path(const std::string &path)
{
    return path.empty() || path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

} // namespace

DatabaseOptions DatabaseOptions::from_config(const ServiceConfig &config)
{
    return DatabaseOptions{.path = config.database_path(),
                           .busy_timeout = config.busy_timeout(),
                           .wal = config.wal_enabled()};
}

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::Statement(Database &db, sqlite3_stmt *stmt) noexcept : m_db(&db), m_stmt(stmt) {}

Statement::Statement(Statement &&other) noexcept : m_db(other.m_db), m_stmt(other.m_stmt)
{
    other.m_stmt = nullptr;
}

Statement::~Statement()
{
    if (m_stmt != nullptr)
    {
        sqlite3_finalize(m_stmt);
    }
}

Statement &Statement::bind(int index, std::string_view value)
{
    m_db->check_(sqlite3_bind_text(m_stmt, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT),
                 "bind text");
    return *this;
}

Statement &Statement::bind(int index, int64_t value)
{
    m_db->check_(sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value)), "bind int");
    return *this;
}

Statement &Statement::bind(int index, double value)
{
    m_db->check_(sqlite3_bind_double(m_stmt, index, value), "bind double");
    return *this;
}

Statement &Statement::bind(int index, std::nullopt_t)
{
    m_db->check_(sqlite3_bind_null(m_stmt, index), "bind null");
    return *this;
}

Statement &Statement::bind(int index, const std::optional<std::string> &value)
{
    if (value)
        return bind(index, std::string_view(*value));
    return bind(index, std::nullopt);
}

bool Statement::step()
{
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    m_db->check_(rc, sqlite3_sql(m_stmt));
    return false;
}

void Statement::run()
{
    while (step())
    {
    }
}

std::string Statement::column_text(int col) const
{
    const auto *text = sqlite3_column_text(m_stmt, col);
    if (text == nullptr)
        return {};
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, col)));
}

std::optional<std::string> Statement::column_optional_text(int col) const
{
    if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL)
        return std::nullopt;
    return column_text(col);
}

int64_t Statement::column_int64(int col) const
{
    return static_cast<int64_t>(sqlite3_column_int64(m_stmt, col));
}

double Statement::column_double(int col) const
{
    return sqlite3_column_double(m_stmt, col);
}

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

Database::Database(DatabaseOptions options) : m_options(std::move(options))
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
    const int rc = sqlite3_open_v2(m_options.path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = m_db != nullptr ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StoreError(fmt::format("Failed to open database '{}': {}", m_options.path, msg), rc);
    }
    auto close_on_error = basics::make_scope_guard(
        [this]() noexcept
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        });
    configure_();
    initialize_schema_();
    close_on_error.dismiss();
    LOGGER_DEBUG("Database: opened '{}' (wal={}, busy_timeout={}ms)", m_options.path,
                 m_options.wal && !is_memory_path(m_options.path), m_options.busy_timeout.count());
}

Database::~Database()
{
    if (m_db != nullptr)
    {
        const int rc = sqlite3_close_v2(m_db);
        if (rc != SQLITE_OK)
        {
            LOGGER_ERROR("Database: close of '{}' failed: {}", m_options.path, sqlite3_errstr(rc));
        }
    }
}

void Database::configure_()
{
    sqlite3_extended_result_codes(m_db, 1);
    check_(sqlite3_busy_timeout(m_db, static_cast<int>(m_options.busy_timeout.count())), "busy_timeout");
    exec("PRAGMA foreign_keys = ON");
    if (m_options.wal && !is_memory_path(m_options.path))
    {
        exec("PRAGMA journal_mode = WAL");
    }
}

void Database::initialize_schema_()
{
    exec(kSchema);
}

void Database::exec(std::string_view sql)
{
    const std::string owned(sql);
    char *err = nullptr;
    const int rc = sqlite3_exec(m_db, owned.c_str(), nullptr, nullptr, &err);
    if (err != nullptr)
    {
        sqlite3_free(err);
    }
    check_(rc, owned);
}

Statement Database::prepare(std::string_view sql)
{
    sqlite3_stmt *stmt = nullptr;
    const int rc = sqlite3_prepare_v2(m_db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        sqlite3_finalize(stmt);
        check_(rc, sql);
    }
    return Statement(*this, stmt);
}

int Database::changes() const noexcept
{
    return sqlite3_changes(m_db);
}

bool Database::in_transaction() const noexcept
{
    return sqlite3_get_autocommit(m_db) == 0;
}

void Database::transaction(const std::function<void()> &body)
{
    if (m_txn_owner.load() == std::this_thread::get_id())
    {
        throw ValidationError("Nested store transaction on the same thread");
    }
    std::lock_guard<std::mutex> txn_lock(m_txn_mutex);
    m_txn_owner.store(std::this_thread::get_id());
    auto release_owner = basics::make_scope_guard([this]() noexcept { m_txn_owner.store(std::thread::id{}); });

    exec("BEGIN IMMEDIATE");
    try
    {
        body();
        exec("COMMIT");
    }
    catch (...)
    {
        // A failed statement may already have ended the transaction.
        if (in_transaction())
        {
            const int rc = sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            if (rc != SQLITE_OK)
            {
                LOGGER_ERROR("Database: ROLLBACK failed: {}", sqlite3_errmsg(m_db));
            }
        }
        throw;
    }
}

void Database::check_(int rc, std::string_view context) const
{
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE)
        return;

    // Prefer the connection's extended code when it refines the one we were given.
    const int ext = sqlite3_extended_errcode(m_db);
    const int code = ((ext & 0xff) == (rc & 0xff)) ? ext : rc;
    const std::string msg = fmt::format("{} ({})", sqlite3_errmsg(m_db), context);

    switch (code & 0xff)
    {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        throw TransientStoreError(msg, code);
    case SQLITE_CONSTRAINT:
        switch (code)
        {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            throw ConflictError(msg);
        case SQLITE_CONSTRAINT_FOREIGNKEY:
        case SQLITE_CONSTRAINT_NOTNULL:
        case SQLITE_CONSTRAINT_CHECK:
            throw ValidationError(msg);
        default:
            break;
        }
        break;
    default:
        break;
    }
    throw StoreError(msg, code);
}

} // namespace kanbanhub::store
