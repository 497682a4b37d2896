/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the `syncdesk::platform` utilities.
 *
 * Process and thread IDs, the current executable's path, process liveness and the package
 * version. Preprocessor branches select the Windows, macOS, Linux or generic POSIX variant.
 */
#include "sd_base.hpp"
#include "syncdesk_version.h"

#include <chrono>
#include <thread>
#include <vector>

#if defined(SYNCDESK_IS_POSIX)
#include <cerrno>
#include <climits>
#include <csignal>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(SYNCDESK_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace syncdesk::platform
{

uint64_t get_pid()
{
#if defined(SYNCDESK_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses `GetCurrentThreadId`, `pthread_threadid_np` or `syscall(SYS_gettid)`; other
 *          systems fall back to hashing std::thread::id.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(SYNCDESK_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details Used to locate the configuration directory relative to the binary and by the test
 *          harness to re-spawn itself. `GetModuleFileNameW` (Windows), `/proc/self/exe` (Linux),
 *          `_NSGetExecutablePath` (macOS).
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(SYNCDESK_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = syncdesk::format_tools::ws2s(std::wstring(buf.data(), len));

#elif defined(SYNCDESK_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));

#elif defined(SYNCDESK_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr ? std::string(resolved)
                                                                      : std::string(buf.data());
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
            {
                full_path = procbuf;
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from syncdesk_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return SYNCDESK_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return SYNCDESK_VERSION_MINOR;
}

int get_version_patch() noexcept
{
    return SYNCDESK_VERSION_PATCH;
}

const char *get_version_string() noexcept
{
    return SYNCDESK_VERSION_STRING;
}

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details POSIX: `kill(pid, 0)`; ESRCH means dead, EPERM means alive but not ours.
 *          Windows: the process handle's exit code is STILL_ACTIVE.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }

#if defined(SYNCDESK_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }

    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);
    if (!result)
    {
        return false;
    }
    return exitCode == STILL_ACTIVE;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace syncdesk::platform
