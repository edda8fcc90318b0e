/**
 * @file format_tools.cpp
 * @brief Timestamp and string formatting helpers.
 */
#include "utils/format_tools.hpp"

#include <cctype>
#include <ctime>
#include <utility>

#include <fmt/chrono.h>

namespace kanbanhub::format_tools
{

namespace
{
// Splits a time_point into whole seconds and the sub-second remainder, normalised to
// [0, Period) even for timestamps before the epoch.
template <typename Duration>
std::pair<std::tm, long long> split_seconds(std::chrono::system_clock::time_point timestamp)
{
    auto tp = std::chrono::time_point_cast<Duration>(timestamp);
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto frac = std::chrono::duration_cast<Duration>(tp - secs).count();
    return {fmt::gmtime(std::chrono::system_clock::to_time_t(secs)), static_cast<long long>(frac)};
}
} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto [secs, us] = split_seconds<std::chrono::microseconds>(timestamp);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", secs, us);
}

std::string iso8601(std::chrono::system_clock::time_point timestamp)
{
    auto [secs, ms] = split_seconds<std::chrono::milliseconds>(timestamp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", secs, ms);
}

std::string iso8601_now()
{
    return iso8601(std::chrono::system_clock::now());
}

std::string slugify(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name)
    {
        if (std::isalnum(c) != 0)
        {
            out += static_cast<char>(std::tolower(c));
        }
        else if (!out.empty() && out.back() != '-')
        {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-')
    {
        out.pop_back();
    }
    return out;
}

std::string to_lower(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace kanbanhub::format_tools
