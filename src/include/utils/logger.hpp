/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on the
 *     calling thread and push it into a queue. The call never performs I/O.
 * 2.  **Worker Thread**: A single background thread is the sole consumer of the
 *     queue. It writes to the active sink and applies control commands (sink switch,
 *     flush, error callback) in the order they were enqueued.
 * 3.  **Sinks**: `ConsoleSink` (stderr) and `FileSink` (append-only file).
 * 4.  **Error Reporting**: sink failures are reported to a user callback, which runs on
 *     a separate dispatcher thread so a callback that logs cannot deadlock the worker.
 *
 * The worker starts with the first call to `Logger::instance()`. `shutdown()` drains the
 * queue and joins the worker; messages logged after that are written synchronously to
 * stderr.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Transaction {} committed in {}ms", id, ms);
 *
 * auto &logger = kanbanhub::utils::Logger::instance();
 * logger.set_level(kanbanhub::utils::Logger::Level::L_DEBUG);
 * logger.set_logfile("/var/log/kanbanhub.log");
 * logger.shutdown(); // blocks until all queued messages are written
 * ```
 ******************************************************************************/
#pragma once

#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "kanbanhub_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace kanbanhub::utils
{

class KANBANHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /**
     * @brief Maps a level name ("trace", "debug", "info", "warn"/"warning", "error",
     *        "system", case-insensitive) to a Level.
     * @return std::nullopt for an unknown name.
     */
    static std::optional<Level> parse_level(std::string_view name);

    // --- Sinks ---
    // Sink switches are executed in order by the worker thread; these calls block until
    // the switch has been applied.

    /// Switch logging to the console (stderr).
    bool set_console();

    /**
     * @brief Switch logging to a file, opened in append mode.
     * @return false if the file could not be opened; the previous sink stays active and
     *         the error is reported through the write-error callback.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Blocks until every message queued before this call has been written and the
     *        sink flushed.
     */
    void flush();

    /**
     * @brief Drains the queue and joins the worker thread. Idempotent.
     */
    void shutdown();

    /// @return true while the worker thread accepts messages.
    bool is_running() const noexcept;

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked when a sink fails to open or write.
     *
     * The callback runs on a dedicated dispatcher thread, never on the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    // Enqueues a formatted message, or writes it to stderr once shut down.
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

} // namespace kanbanhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::kanbanhub::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::kanbanhub::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::kanbanhub::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::kanbanhub::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::kanbanhub::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::kanbanhub::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
