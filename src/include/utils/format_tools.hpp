// Tools for formatting strings and timestamps
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace syncdesk::format_tools
{

/**
 * @brief Formats a system_clock time_point into local time with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
SYNCDESK_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Formats a system_clock time_point as an ISO-8601 UTC string with milliseconds.
 * @return A string in the format "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
SYNCDESK_UTILS_EXPORT std::string iso8601_utc(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Strips leading and trailing whitespace (including CR/LF).
 */
SYNCDESK_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/**
 * @brief Converts a UTF-8 encoded std::string to a std::wstring on Windows.
 * @return The converted wstring. Returns an empty string on non-Windows platforms.
 */
SYNCDESK_UTILS_EXPORT std::wstring s2ws(const std::string &s);
/**
 * @brief Converts a std::wstring to a UTF-8 encoded std::string on Windows.
 * @return The converted string. Returns an empty string on non-Windows platforms.
 */
SYNCDESK_UTILS_EXPORT std::string ws2s(const std::wstring &w);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');
    std::string_view::size_type last_separator_pos = last_slash;
    if (last_slash == std::string_view::npos ||
        (last_backslash != std::string_view::npos && last_backslash > last_slash))
    {
        last_separator_pos = last_backslash;
    }
    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace syncdesk::format_tools
