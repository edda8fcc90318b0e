#pragma once

/**
 * @file service_config.hpp
 * @brief ServiceConfig - layered JSON configuration for the kanbanhub service.
 *
 * ## Config loading - layered (priority low -> high)
 *
 *  1. Built-in C++ defaults (always applied first)
 *  2. A JSON file: the path passed to load(), else `KANBANHUB_CONFIG_FILE`.
 *     Keys present in the file are merged over the defaults; absent keys keep
 *     their default.
 *  3. `KANBANHUB_DB_PATH` / `KANBANHUB_LOG_LEVEL` / `KANBANHUB_LOG_FILE`
 *     - highest-priority env var overrides applied after file loading
 *
 * ## Keys
 *
 * @code{.json}
 * {
 *   "database":     { "path": "kanban.db", "busy_timeout_ms": 5000, "wal": true },
 *   "logging":      { "level": "info", "file": "" },
 *   "transactions": { "timeout_ms": 0, "retry_attempts": 0,
 *                     "retry_base_delay_ms": 100, "retry_max_delay_ms": 5000 }
 * }
 * @endcode
 *
 * `logging.file` empty means console. `transactions.timeout_ms` 0 means no deadline.
 * A key with the wrong type or an out-of-range value raises ValidationError.
 */

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "kanbanhub_utils_export.h"
#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace kanbanhub
{

class KANBANHUB_UTILS_EXPORT ServiceConfig
{
  public:
    /// Built-in defaults only.
    ServiceConfig();

    /**
     * @brief Runs the full layered load.
     * @param override_path Explicit config file; when empty, `KANBANHUB_CONFIG_FILE` is
     *        consulted. A file that does not exist is logged and skipped.
     * @throws ValidationError if the file is not valid JSON or holds invalid values.
     */
    static ServiceConfig load(const std::filesystem::path &override_path = {});

    /**
     * @brief Defaults merged with @p overrides. No file or environment access.
     * @throws ValidationError on a wrongly typed or out-of-range value.
     */
    static ServiceConfig from_json(const nlohmann::json &overrides);

    // -----------------------------------------------------------------------
    // database
    // -----------------------------------------------------------------------
    const std::string &database_path() const noexcept { return m_database_path; }
    std::chrono::milliseconds busy_timeout() const noexcept { return m_busy_timeout; }
    bool wal_enabled() const noexcept { return m_wal; }

    // -----------------------------------------------------------------------
    // logging
    // -----------------------------------------------------------------------
    utils::Logger::Level log_level() const noexcept { return m_log_level; }
    /** Empty means console. */
    const std::string &log_file() const noexcept { return m_log_file; }

    /**
     * @brief Pushes level and sink to the process logger.
     * @return false if the log file could not be opened (console stays active).
     */
    bool apply_logging() const;

    // -----------------------------------------------------------------------
    // transactions
    // -----------------------------------------------------------------------
    /** Zero means no deadline. */
    std::chrono::milliseconds transaction_timeout() const noexcept { return m_txn_timeout; }
    int retry_attempts() const noexcept { return m_retry_attempts; }
    utils::RetryBackoff retry_backoff() const noexcept { return m_retry_backoff; }

    /** The merged JSON document, for keys without a typed getter. */
    const nlohmann::json &raw() const noexcept { return m_raw; }

  private:
    void apply_json(const nlohmann::json &j);
    void apply_env();

    std::string m_database_path{"kanban.db"};
    std::chrono::milliseconds m_busy_timeout{5000};
    bool m_wal{true};

    utils::Logger::Level m_log_level{utils::Logger::Level::L_INFO};
    std::string m_log_file;

    std::chrono::milliseconds m_txn_timeout{0};
    int m_retry_attempts{0};
    utils::RetryBackoff m_retry_backoff{};

    nlohmann::json m_raw;
};

} // namespace kanbanhub

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
