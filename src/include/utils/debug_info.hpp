/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messages.
 *
 * Format strings are checked at compile time through `fmt::format_string`; the call site is
 * reported through `std::source_location`.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"

/**
 * @brief Formats a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", syncdesk::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace syncdesk::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * Windows: `CaptureStackBackTrace` + DbgHelp symbol and line lookup.
 * POSIX: `backtrace` + `dladdr` + demangling, with an `addr2line` pass for file and line
 * where the tool is available.
 */
SYNCDESK_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Reserved for unrecoverable states (broken invariants, use of a module before the lifecycle
 * initialized it). Formatting failures inside panic are reported and do not prevent the abort.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL FORMAT ERROR DURING PANIC: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr`.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

// Runtime format string; args by const& so make_format_args binds.
template <typename... Args>
inline void debug_msg_rt(std::string_view fmt_str, const Args &...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::vformat(fmt_str, fmt::make_format_args(args...)));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG_RT: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace syncdesk::debug

// ---------------- thin macros for convenience --------------

#ifndef SD_LOC_HERE_STR
#define SD_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `syncdesk::debug::panic` with the current source location.
 */
#ifndef SD_PANIC
#define SD_PANIC(fmt, ...)                                                                         \
    ::syncdesk::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef SD_DEBUG
#if defined(SYNCDESK_ENABLE_DEBUG_MESSAGES)
#define SD_DEBUG(fmt, ...) ::syncdesk::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define SD_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif

#ifndef SD_DEBUG_RT
#if defined(SYNCDESK_ENABLE_DEBUG_MESSAGES)
#define SD_DEBUG_RT(fmt, ...) ::syncdesk::debug::debug_msg_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define SD_DEBUG_RT(fmt, ...)                                                                      \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
