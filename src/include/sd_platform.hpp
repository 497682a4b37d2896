#pragma once
/**
 * @file sd_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * Every file that needs the platform macros (SYNCDESK_PLATFORM_WIN64, SYNCDESK_IS_POSIX, ...)
 * or the Windows headers includes this. It is self-contained.
 *
 * Build-system macros (PLATFORM_WIN64, PLATFORM_LINUX, ...) win over compiler predefined ones.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64) || (!defined(PLATFORM_APPLE) && !defined(PLATFORM_FREEBSD) &&          \
                                !defined(PLATFORM_LINUX) && !defined(PLATFORM_UNKNOWN) &&          \
                                defined(_WIN64))
#define SYNCDESK_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE) || (!defined(PLATFORM_FREEBSD) && !defined(PLATFORM_LINUX) &&        \
                                  !defined(PLATFORM_UNKNOWN) && defined(__APPLE__) &&              \
                                  defined(__MACH__))
#define SYNCDESK_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD) ||                                                                 \
    (!defined(PLATFORM_LINUX) && !defined(PLATFORM_UNKNOWN) && defined(__FreeBSD__))
#define SYNCDESK_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX) || (!defined(PLATFORM_UNKNOWN) && defined(__linux__))
#define SYNCDESK_PLATFORM_LINUX 1
#else
#define SYNCDESK_PLATFORM_UNKNOWN 1
#endif

#if defined(SYNCDESK_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(SYNCDESK_PLATFORM_WIN64)
#define SYNCDESK_IS_WINDOWS 1
#elif defined(SYNCDESK_PLATFORM_APPLE) || defined(SYNCDESK_PLATFORM_FREEBSD) ||                    \
    defined(SYNCDESK_PLATFORM_LINUX)
#define SYNCDESK_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location and the <chrono> calendar types are used throughout.
// For MSVC use _MSVC_LANG (MSVC sets __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "syncdesk_utils_export.h"

namespace syncdesk::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
SYNCDESK_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
SYNCDESK_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name or path. Returns "unknown" on failure.
 */
SYNCDESK_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

SYNCDESK_UTILS_EXPORT int get_version_major() noexcept;
SYNCDESK_UTILS_EXPORT int get_version_minor() noexcept;
SYNCDESK_UTILS_EXPORT int get_version_patch() noexcept;
/**
 * @brief Gets the full version string (major.minor.patch).
 */
SYNCDESK_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Windows: OpenProcess() + GetExitCodeProcess(). POSIX: kill(pid, 0) with errno check.
 * @note PID 0 always returns false. On POSIX, EPERM is treated as "alive".
 */
SYNCDESK_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds (steady_clock).
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
SYNCDESK_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, or 0 if start_ns is in the future.
 */
SYNCDESK_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace syncdesk::platform
