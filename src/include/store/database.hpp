#pragma once
/**
 * @file database.hpp
 * @brief SQLite-backed Store with RAII prepared statements.
 *
 * One Database owns one connection opened in serialized (FULLMUTEX) mode, so the
 * connection may be used from the worker thread of a timed transaction as well as from
 * the caller's thread. Store transactions are serialised by an internal mutex.
 *
 * The schema (boards, columns, tasks, task_dependencies, notes, tags, task_tags) is
 * created on open if missing; foreign keys are always enabled.
 *
 * SQLite result codes are translated in one place, check_():
 *
 * | SQLite                                   | Thrown                |
 * |------------------------------------------|-----------------------|
 * | SQLITE_BUSY, SQLITE_LOCKED               | TransientStoreError   |
 * | SQLITE_CONSTRAINT_UNIQUE / _PRIMARYKEY   | ConflictError         |
 * | SQLITE_CONSTRAINT_FOREIGNKEY / _NOTNULL / _CHECK | ValidationError |
 * | anything else                            | StoreError            |
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "store/store.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace kanbanhub
{
class ServiceConfig;
} // namespace kanbanhub

namespace kanbanhub::store
{

class Database;

struct DatabaseOptions
{
    std::string path{":memory:"};
    std::chrono::milliseconds busy_timeout{5000};
    bool wal{true};

    static DatabaseOptions from_config(const ServiceConfig &config);
};

/**
 * @class Statement
 * @brief Owns one prepared statement; finalized on destruction.
 *
 * Parameters are 1-based, columns 0-based, as in the SQLite C API.
 */
class Statement
{
  public:
    Statement(Database &db, sqlite3_stmt *stmt) noexcept;
    ~Statement();

    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&) = delete;
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    Statement &bind(int index, std::string_view value);
    Statement &bind(int index, const std::string &value) { return bind(index, std::string_view(value)); }
    Statement &bind(int index, const char *value) { return bind(index, std::string_view(value)); }
    Statement &bind(int index, int64_t value);
    Statement &bind(int index, int value) { return bind(index, static_cast<int64_t>(value)); }
    Statement &bind(int index, bool value) { return bind(index, static_cast<int64_t>(value ? 1 : 0)); }
    Statement &bind(int index, double value);
    Statement &bind(int index, std::nullopt_t);
    Statement &bind(int index, const std::optional<std::string> &value);

    /// Binds each argument in order starting at parameter 1.
    template <typename... Args> Statement &bind_all(const Args &...args)
    {
        int index = 0;
        (bind(++index, args), ...);
        return *this;
    }

    /// Advances one row. @return true if a row is available.
    bool step();

    /// Steps to completion, discarding rows.
    void run();

    std::string column_text(int col) const;
    std::optional<std::string> column_optional_text(int col) const;
    int64_t column_int64(int col) const;
    int column_int(int col) const { return static_cast<int>(column_int64(col)); }
    double column_double(int col) const;
    bool column_bool(int col) const { return column_int64(col) != 0; }

  private:
    Database *m_db;
    sqlite3_stmt *m_stmt;
};

class Database : public Store
{
  public:
    explicit Database(DatabaseOptions options = {});
    ~Database() override;

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    /// BEGIN IMMEDIATE / body / COMMIT, or ROLLBACK and rethrow.
    /// @throws ValidationError if called again from inside a running body on the same thread.
    void transaction(const std::function<void()> &body) override;

    void exec(std::string_view sql) override;

    Statement prepare(std::string_view sql);

    /// Number of rows changed by the most recent INSERT/UPDATE/DELETE on this connection.
    int changes() const noexcept;

    bool in_transaction() const noexcept;

    const DatabaseOptions &options() const noexcept { return m_options; }

    /**
     * @brief Throws the kanbanhub exception matching SQLite result code @p rc.
     *        Returns normally for SQLITE_OK / SQLITE_ROW / SQLITE_DONE.
     */
    void check_(int rc, std::string_view context) const;

  private:
    void configure_();
    void initialize_schema_();

    DatabaseOptions m_options;
    sqlite3 *m_db = nullptr;
    std::mutex m_txn_mutex;
    std::atomic<std::thread::id> m_txn_owner{}; // default id: no transaction open
};

} // namespace kanbanhub::store
