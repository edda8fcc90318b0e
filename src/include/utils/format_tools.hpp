// Tools for formatting strings, timestamps and durations
#pragma once
#include <chrono>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "kanbanhub_utils_export.h"

namespace kanbanhub::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us" (UTC).
 */
KANBANHUB_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a system_clock time_point as an ISO-8601 UTC string with millisecond
 *        precision, e.g. "2026-03-01T12:30:45.123Z". This is the representation the
 *        store uses for created_at / updated_at columns.
 */
KANBANHUB_UTILS_EXPORT std::string iso8601(std::chrono::system_clock::time_point timestamp);

/// Current time as iso8601().
KANBANHUB_UTILS_EXPORT std::string iso8601_now();

/**
 * @brief Derives a URL-safe slug from a human readable name.
 *
 * Lowercases ASCII letters, keeps digits, and collapses every other run of characters
 * into a single '-'. Leading and trailing '-' are stripped.
 *
 * "Needs Review!" -> "needs-review"
 */
KANBANHUB_UTILS_EXPORT std::string slugify(std::string_view name);

/**
 * @brief Returns a lowercase ASCII copy of @p s.
 */
KANBANHUB_UTILS_EXPORT std::string to_lower(std::string_view s);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128); // small reserve to avoid many reallocs
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

} // namespace kanbanhub::format_tools
