#include "utils/logger_sinks/sink.hpp"

#include <array>

#include "utils/format_tools.hpp"

namespace kanbanhub::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<std::string_view, 6> kLevelNames{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM"};
} // namespace

std::string_view Sink::level_name(int level) noexcept
{
    if (level < 0 || static_cast<std::size_t>(level) >= kLevelNames.size())
        return "UNK";
    return kLevelNames[static_cast<std::size_t>(level)];
}

// [LEVEL ] [time] [PID:    n TID:    n] body
std::string Sink::render(const LogMessage &msg)
{
    return fmt::format("[{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", level_name(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.process_id, msg.thread_id,
                       std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace kanbanhub::utils
