#include "utils/process_terminator.hpp"
#include "utils/logger.hpp"

#if defined(SYNCDESK_PLATFORM_WIN64)
#include <vector>
#else
#include <cerrno>
#include <csignal>
#include <sys/types.h>
#endif

namespace syncdesk::sync
{

#if defined(SYNCDESK_IS_POSIX)

namespace
{

std::error_code signal_group(const ProcessHandle &handle, int sig)
{
    if (handle.pid <= 0)
        return std::make_error_code(std::errc::invalid_argument);

    const auto pid = static_cast<pid_t>(handle.pid);
    // The worker leads its own group; fall back to the single pid if the group is gone.
    if (::kill(-pid, sig) == 0)
        return {};
    if (errno == ESRCH && ::kill(pid, sig) == 0)
        return {};
    return {errno, std::generic_category()};
}

} // namespace

std::error_code SignalTerminator::request_graceful(const ProcessHandle &handle)
{
    return signal_group(handle, SIGTERM);
}

std::error_code SignalTerminator::force_kill(const ProcessHandle &handle)
{
    return signal_group(handle, SIGKILL);
}

std::unique_ptr<ProcessTerminator> make_platform_terminator()
{
    return std::make_unique<SignalTerminator>();
}

#elif defined(SYNCDESK_PLATFORM_WIN64)

namespace
{

constexpr DWORD kTaskkillWaitMs = 5000;

// Runs taskkill and maps its exit status: 128 means "process not found".
std::error_code run_taskkill(const ProcessHandle &handle, bool force)
{
    if (handle.pid <= 0)
        return std::make_error_code(std::errc::invalid_argument);

    std::wstring cmd = format_tools::s2ws(
        fmt::format("taskkill /pid {}{} /t", handle.pid, force ? " /f" : ""));
    std::vector<wchar_t> buf(cmd.begin(), cmd.end());
    buf.push_back(L'\0');

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;
    PROCESS_INFORMATION pi{};
    if (!CreateProcessW(nullptr, buf.data(), nullptr, nullptr, FALSE, CREATE_NO_WINDOW, nullptr,
                        nullptr, &si, &pi))
    {
        return {static_cast<int>(GetLastError()), std::system_category()};
    }
    CloseHandle(pi.hThread);

    std::error_code ec;
    if (WaitForSingleObject(pi.hProcess, kTaskkillWaitMs) != WAIT_OBJECT_0)
    {
        ec = std::make_error_code(std::errc::timed_out);
    }
    else
    {
        DWORD code = 0;
        GetExitCodeProcess(pi.hProcess, &code);
        if (code == 128)
            ec = std::make_error_code(std::errc::no_such_process);
        else if (code != 0)
            ec = std::make_error_code(std::errc::operation_not_permitted);
    }
    CloseHandle(pi.hProcess);
    return ec;
}

} // namespace

std::error_code TaskkillTerminator::request_graceful(const ProcessHandle &handle)
{
    return run_taskkill(handle, false);
}

std::error_code TaskkillTerminator::force_kill(const ProcessHandle &handle)
{
    return run_taskkill(handle, true);
}

std::unique_ptr<ProcessTerminator> make_platform_terminator()
{
    return std::make_unique<TaskkillTerminator>();
}

#else
#error "No process terminator for this platform"
#endif

} // namespace syncdesk::sync
