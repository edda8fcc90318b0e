#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace kanbanhub::utils
{

/// One formatted record travelling from the logger queue to a sink.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // Logger::Level as int; sinks do not depend on logger.hpp
    fmt::memory_buffer body;
};

/**
 * @brief Destination for log records.
 *
 * Sinks are only ever touched by the logger's worker thread, so implementations need
 * no locking of their own.
 */
class Sink
{
  public:
    virtual ~Sink() = default;

    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    /// Human-readable target, recorded when the logger switches sinks.
    virtual std::string description() const = 0;

    static std::string_view level_name(int level) noexcept;
    /// Renders @p msg as one newline-terminated line.
    static std::string render(const LogMessage &msg);
};

} // namespace kanbanhub::utils
