#include "utils/process_supervisor.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <mutex>
#include <thread>

#if defined(SYNCDESK_PLATFORM_WIN64)
#include <cwchar>
#else
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace syncdesk::sync
{

const char *to_string(ProcessError e) noexcept
{
    switch (e)
    {
    case ProcessError::ProcessSpawnError:
        return "ProcessSpawnError";
    case ProcessError::ProcessStartTimeout:
        return "ProcessStartTimeout";
    case ProcessError::ProcessCrashed:
        return "ProcessCrashed";
    case ProcessError::AlreadyRunning:
        return "AlreadyRunning";
    }
    return "Unknown";
}

const char *to_string(WorkerState s) noexcept
{
    switch (s)
    {
    case WorkerState::Stopped:
        return "Stopped";
    case WorkerState::Starting:
        return "Starting";
    case WorkerState::Ready:
        return "Ready";
    case WorkerState::Stopping:
        return "Stopping";
    case WorkerState::Crashed:
        return "Crashed";
    }
    return "Unknown";
}

WorkerLaunchSpec WorkerLaunchSpec::from_settings(const WorkerSettings &settings)
{
    WorkerLaunchSpec spec;
    spec.argv = settings.argv;
    spec.working_dir = settings.working_dir;
    spec.env = settings.env;
    spec.ready_markers = settings.ready_markers;
    spec.start_timeout = settings.start_timeout;
    spec.stop_grace = settings.stop_grace;
    return spec;
}

namespace
{

constexpr std::chrono::milliseconds kMonitorPoll{50};
// How long stop() waits for the OS to reap a killed worker.
constexpr std::chrono::milliseconds kReapWait{2000};
// Bounds the final drain when a grandchild keeps the pipes open and busy.
constexpr int kMaxDrainReads = 64;

/// Finds any of the markers in a byte stream delivered in arbitrary chunks.
class MarkerScanner
{
  public:
    void reset(const std::vector<std::string> &markers)
    {
        m_markers = markers;
        m_window.clear();
        m_keep = 0;
        for (const auto &m : m_markers)
            m_keep = std::max(m_keep, m.empty() ? size_t{0} : m.size() - 1);
    }

    /// Returns the first marker found in the stream so far, or nullptr.
    const std::string *feed(std::string_view chunk)
    {
        m_window.append(chunk);
        for (const auto &m : m_markers)
        {
            if (!m.empty() && m_window.find(m) != std::string::npos)
                return &m;
        }
        // Keep just enough to complete a marker that straddles the next read.
        if (m_window.size() > m_keep)
            m_window.erase(0, m_window.size() - m_keep);
        return nullptr;
    }

  private:
    std::vector<std::string> m_markers;
    std::string m_window;
    size_t m_keep{0};
};

class LineSplitter
{
  public:
    template <typename Fn> void feed(std::string_view chunk, Fn &&on_line)
    {
        m_partial.append(chunk);
        size_t start = 0;
        for (size_t nl = m_partial.find('\n'); nl != std::string::npos;
             nl = m_partial.find('\n', start))
        {
            std::string_view line(m_partial.data() + start, nl - start);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            on_line(line);
            start = nl + 1;
        }
        m_partial.erase(0, start);
    }

    template <typename Fn> void flush(Fn &&on_line)
    {
        if (!m_partial.empty())
            on_line(std::string_view(m_partial));
        m_partial.clear();
    }

  private:
    std::string m_partial;
};

} // namespace

struct ProcessSupervisor::Impl
{
    WorkerLaunchSpec spec;
    std::unique_ptr<ProcessTerminator> terminator;

    std::mutex op_mutex; // serializes start() and stop()
    mutable std::mutex mutex;
    std::condition_variable cv;
    WorkerState state{WorkerState::Stopped};
    ProcessHandle handle{};
    bool has_process{false};
    bool exited{false};
    std::optional<int> last_exit_code;
    ExitCallback on_exit;
    std::atomic<bool> abandon{false};
    std::thread monitor;

    // Touched by the monitor thread only while it runs.
    MarkerScanner scanner;
    LineSplitter out_lines;
    LineSplitter err_lines;

    bool spawn(int &sys_error);
    void release_process();

    void handle_stdout(std::string_view chunk);
    void handle_stderr(std::string_view chunk);
    void finish_output();
    void handle_exit(int exit_code);

#if defined(SYNCDESK_PLATFORM_WIN64)
    void monitor_loop(HANDLE out_pipe, HANDLE err_pipe, HANDLE process);
#else
    void monitor_loop(int out_fd, int err_fd, pid_t pid);
#endif
};

// ============================================================================
// Output and exit handling (monitor thread)
// ============================================================================

void ProcessSupervisor::Impl::handle_stdout(std::string_view chunk)
{
    out_lines.feed(chunk, [](std::string_view line) { LOGGER_DEBUG("[worker] {}", line); });

    bool became_ready = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == WorkerState::Starting)
        {
            if (const std::string *marker = scanner.feed(chunk))
            {
                state = WorkerState::Ready;
                became_ready = true;
                LOGGER_INFO("ProcessSupervisor: worker pid {} is ready (saw '{}')", handle.pid,
                            *marker);
            }
        }
    }
    if (became_ready)
        cv.notify_all();
}

void ProcessSupervisor::Impl::handle_stderr(std::string_view chunk)
{
    err_lines.feed(chunk, [](std::string_view line) { LOGGER_WARN("[worker] {}", line); });
}

void ProcessSupervisor::Impl::finish_output()
{
    out_lines.flush([](std::string_view line) { LOGGER_DEBUG("[worker] {}", line); });
    err_lines.flush([](std::string_view line) { LOGGER_WARN("[worker] {}", line); });
}

void ProcessSupervisor::Impl::handle_exit(int exit_code)
{
    ExitCallback cb;
    bool crashed = false;
    int64_t pid = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        exited = true;
        last_exit_code = exit_code;
        pid = handle.pid;
        if (state == WorkerState::Ready)
        {
            state = WorkerState::Crashed;
            crashed = true;
            cb = on_exit;
        }
        else if (state == WorkerState::Starting)
        {
            // start() reports ProcessCrashed.
            state = WorkerState::Crashed;
        }
    }
    cv.notify_all();

    if (!crashed)
    {
        LOGGER_DEBUG("ProcessSupervisor: worker pid {} exited with code {}", pid, exit_code);
        return;
    }
    LOGGER_WARN("ProcessSupervisor: worker pid {} exited unexpectedly with code {}", pid,
                exit_code);
    if (cb)
    {
        try
        {
            cb(exit_code);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("ProcessSupervisor: exit callback threw: {}", e.what());
        }
    }
}

// ============================================================================
// Platform: spawn and monitor
// ============================================================================

#if defined(SYNCDESK_IS_POSIX)

namespace
{

bool make_cloexec_pipe(int fds[2])
{
    if (::pipe(fds) != 0)
        return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void close_fd(int &fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Async-signal-safe failure report from the forked child.
[[noreturn]] void child_fail(int report_fd)
{
    const int err = errno;
    ssize_t n;
    do
    {
        n = ::write(report_fd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    ::_exit(127);
}

} // namespace

bool ProcessSupervisor::Impl::spawn(int &sys_error)
{
    // Everything the child needs is built before fork().
    std::vector<char *> argv;
    for (const auto &a : spec.argv)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char **e = environ; e && *e; ++e)
    {
        std::string_view entry(*e);
        const auto key = entry.substr(0, entry.find('='));
        if (spec.env.find(std::string(key)) == spec.env.end())
            env_strings.emplace_back(entry);
    }
    for (const auto &[key, value] : spec.env)
        env_strings.push_back(key + "=" + value);
    std::vector<char *> envp;
    for (auto &s : env_strings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    const std::string working_dir = spec.working_dir.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (!make_cloexec_pipe(out_pipe) || !make_cloexec_pipe(err_pipe) ||
        !make_cloexec_pipe(exec_pipe))
    {
        sys_error = errno;
        for (int *p : {out_pipe, err_pipe, exec_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        sys_error = errno;
        for (int *p : {out_pipe, err_pipe, exec_pipe})
        {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return false;
    }

    if (pid == 0)
    {
        // Child: own process group so the terminator can reach the whole tree.
        ::setpgid(0, 0);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 || ::dup2(err_pipe[1], STDERR_FILENO) < 0)
            child_fail(exec_pipe[1]);
        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0)
            child_fail(exec_pipe[1]);

        environ = envp.data();
        ::execvp(argv[0], argv.data());
        child_fail(exec_pipe[1]);
    }

    // Parent. Repeat the group change to close the race with the child's own setpgid.
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        // exec failed; the child has already exited.
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        sys_error = child_errno;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        handle.pid = pid;
        handle.native = nullptr;
        has_process = true;
    }
    monitor = std::thread(
        [this, out_fd = out_pipe[0], err_fd = err_pipe[0], pid]
        { monitor_loop(out_fd, err_fd, pid); });
    return true;
}

void ProcessSupervisor::Impl::monitor_loop(int out_fd, int err_fd, pid_t pid)
{
    std::array<char, 4096> buf{};
    bool reaped = false;
    int exit_code = -1;

    auto read_one = [&](int &fd, bool is_stdout)
    {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0)
        {
            const std::string_view chunk(buf.data(), static_cast<size_t>(n));
            if (is_stdout)
                handle_stdout(chunk);
            else
                handle_stderr(chunk);
            return true;
        }
        if (n == 0 || (errno != EINTR && errno != EAGAIN))
            close_fd(fd);
        return false;
    };

    // Returns true if any data was read.
    auto pump = [&](int timeout_ms)
    {
        std::array<pollfd, 2> fds{};
        int nfds = 0;
        int *owners[2] = {nullptr, nullptr};
        bool is_out[2] = {false, false};
        if (out_fd >= 0)
        {
            fds[nfds] = {out_fd, POLLIN, 0};
            owners[nfds] = &out_fd;
            is_out[nfds++] = true;
        }
        if (err_fd >= 0)
        {
            fds[nfds] = {err_fd, POLLIN, 0};
            owners[nfds] = &err_fd;
            is_out[nfds++] = false;
        }
        if (nfds == 0)
        {
            if (timeout_ms > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return false;
        }
        const int r = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeout_ms);
        if (r <= 0)
            return false;
        bool got = false;
        for (int i = 0; i < nfds; ++i)
        {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR))
                got = read_one(*owners[i], is_out[i]) || got;
        }
        return got;
    };

    while (!abandon.load(std::memory_order_acquire))
    {
        pump(static_cast<int>(kMonitorPoll.count()));

        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid)
        {
            reaped = true;
            exit_code = decode_wait_status(status);
            break;
        }
        if (r < 0 && errno == ECHILD)
        {
            reaped = true;
            break;
        }
    }

    for (int i = 0; reaped && i < kMaxDrainReads && pump(0); ++i)
    {
    }
    close_fd(out_fd);
    close_fd(err_fd);
    finish_output();

    if (reaped)
        handle_exit(exit_code);
    else
        LOGGER_WARN("ProcessSupervisor: abandoned monitoring of pid {}", pid);
}

#elif defined(SYNCDESK_PLATFORM_WIN64)

namespace
{

std::wstring quote_arg(const std::string &arg)
{
    std::wstring w = format_tools::s2ws(arg);
    if (!w.empty() && w.find_first_of(L" \t\"") == std::wstring::npos)
        return w;
    std::wstring out = L"\"";
    size_t backslashes = 0;
    for (wchar_t c : w)
    {
        if (c == L'\\')
        {
            ++backslashes;
            continue;
        }
        if (c == L'"')
            out.append(backslashes * 2 + 1, L'\\');
        else
            out.append(backslashes, L'\\');
        backslashes = 0;
        out.push_back(c);
    }
    out.append(backslashes * 2, L'\\');
    out.push_back(L'"');
    return out;
}

std::vector<wchar_t> build_environment_block(const std::map<std::string, std::string> &extra)
{
    std::map<std::wstring, std::wstring> vars;
    if (LPWCH block = GetEnvironmentStringsW())
    {
        for (LPWCH p = block; *p; p += std::wcslen(p) + 1)
        {
            std::wstring entry(p);
            const auto eq = entry.find(L'=', 1); // entries such as "=C:=C:\" start with '='
            if (eq == std::wstring::npos)
                continue;
            vars[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
        FreeEnvironmentStringsW(block);
    }
    for (const auto &[key, value] : extra)
        vars[format_tools::s2ws(key)] = format_tools::s2ws(value);

    std::vector<wchar_t> out;
    for (const auto &[key, value] : vars)
    {
        out.insert(out.end(), key.begin(), key.end());
        out.push_back(L'=');
        out.insert(out.end(), value.begin(), value.end());
        out.push_back(L'\0');
    }
    out.push_back(L'\0');
    return out;
}

void close_handle(HANDLE &h)
{
    if (h && h != INVALID_HANDLE_VALUE)
    {
        CloseHandle(h);
        h = nullptr;
    }
}

} // namespace

bool ProcessSupervisor::Impl::spawn(int &sys_error)
{
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_r = nullptr, out_w = nullptr, err_r = nullptr, err_w = nullptr;
    if (!CreatePipe(&out_r, &out_w, &sa, 0) || !CreatePipe(&err_r, &err_w, &sa, 0))
    {
        sys_error = static_cast<int>(GetLastError());
        close_handle(out_r);
        close_handle(out_w);
        close_handle(err_r);
        close_handle(err_w);
        return false;
    }
    SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

    std::wstring cmdline;
    for (const auto &a : spec.argv)
    {
        if (!cmdline.empty())
            cmdline.push_back(L' ');
        cmdline += quote_arg(a);
    }
    std::vector<wchar_t> cmd_buf(cmdline.begin(), cmdline.end());
    cmd_buf.push_back(L'\0');
    auto env_block = build_environment_block(spec.env);
    const std::wstring cwd = spec.working_dir.wstring();

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = out_w;
    si.hStdError = err_w;
    PROCESS_INFORMATION pi{};

    const BOOL ok = CreateProcessW(
        nullptr, cmd_buf.data(), nullptr, nullptr, TRUE,
        CREATE_UNICODE_ENVIRONMENT | CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW,
        env_block.data(), cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
    if (!ok)
        sys_error = static_cast<int>(GetLastError());
    // The child owns the write ends now.
    close_handle(out_w);
    close_handle(err_w);
    if (!ok)
    {
        close_handle(out_r);
        close_handle(err_r);
        return false;
    }
    CloseHandle(pi.hThread);

    {
        std::lock_guard<std::mutex> lock(mutex);
        handle.pid = static_cast<int64_t>(pi.dwProcessId);
        handle.native = pi.hProcess;
        has_process = true;
    }
    monitor = std::thread([this, out_r, err_r, proc = pi.hProcess]
                          { monitor_loop(out_r, err_r, proc); });
    return true;
}

void ProcessSupervisor::Impl::monitor_loop(HANDLE out_pipe, HANDLE err_pipe, HANDLE process)
{
    std::array<char, 4096> buf{};
    bool reaped = false;
    int exit_code = -1;

    auto pump_pipe = [&](HANDLE &pipe, bool is_stdout)
    {
        if (!pipe)
            return false;
        DWORD avail = 0;
        if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &avail, nullptr))
        {
            close_handle(pipe); // broken pipe: writer closed
            return false;
        }
        if (avail == 0)
            return false;
        DWORD n = 0;
        if (!ReadFile(pipe, buf.data(), std::min<DWORD>(avail, static_cast<DWORD>(buf.size())),
                      &n, nullptr) ||
            n == 0)
        {
            close_handle(pipe);
            return false;
        }
        const std::string_view chunk(buf.data(), n);
        if (is_stdout)
            handle_stdout(chunk);
        else
            handle_stderr(chunk);
        return true;
    };

    while (!abandon.load(std::memory_order_acquire))
    {
        while (pump_pipe(out_pipe, true) || pump_pipe(err_pipe, false))
        {
        }
        if (WaitForSingleObject(process, static_cast<DWORD>(kMonitorPoll.count())) ==
            WAIT_OBJECT_0)
        {
            DWORD code = 0;
            GetExitCodeProcess(process, &code);
            exit_code = static_cast<int>(code);
            reaped = true;
            break;
        }
    }

    for (int i = 0; reaped && i < kMaxDrainReads &&
                    (pump_pipe(out_pipe, true) || pump_pipe(err_pipe, false));
         ++i)
    {
    }
    close_handle(out_pipe);
    close_handle(err_pipe);
    finish_output();

    if (reaped)
        handle_exit(exit_code);
    else
        LOGGER_WARN("ProcessSupervisor: abandoned monitoring of pid {}", handle.pid);
}

#endif

// Caller holds op_mutex, not mutex.
void ProcessSupervisor::Impl::release_process()
{
    if (monitor.joinable())
    {
        if (monitor.get_id() == std::this_thread::get_id())
        {
            SD_PANIC("ProcessSupervisor: start()/stop() called from the exit callback.");
        }
        monitor.join();
    }
    std::lock_guard<std::mutex> lock(mutex);
#if defined(SYNCDESK_PLATFORM_WIN64)
    if (handle.native)
        CloseHandle(static_cast<HANDLE>(handle.native));
#endif
    handle = ProcessHandle{};
    has_process = false;
}

// ============================================================================
// Public interface
// ============================================================================

ProcessSupervisor::ProcessSupervisor(WorkerLaunchSpec spec,
                                     std::unique_ptr<ProcessTerminator> terminator)
    : pImpl(std::make_unique<Impl>())
{
    pImpl->spec = std::move(spec);
    pImpl->terminator = terminator ? std::move(terminator) : make_platform_terminator();
}

ProcessSupervisor::~ProcessSupervisor()
{
    stop();
}

utils::Status<ProcessError> ProcessSupervisor::start()
{
    using R = utils::Status<ProcessError>;
    std::unique_lock<std::mutex> op(pImpl->op_mutex, std::try_to_lock);
    if (!op.owns_lock())
    {
        LOGGER_WARN("ProcessSupervisor: start() refused, another start or stop is in progress");
        return R::error(ProcessError::AlreadyRunning);
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const auto s = pImpl->state;
        if (s == WorkerState::Starting || s == WorkerState::Ready || s == WorkerState::Stopping)
        {
            return R::error(ProcessError::AlreadyRunning);
        }
        if (pImpl->has_process && !pImpl->exited)
        {
            LOGGER_WARN("ProcessSupervisor: previous worker pid {} is still alive; stop() it "
                        "before starting again",
                        pImpl->handle.pid);
            return R::error(ProcessError::AlreadyRunning);
        }
    }
    // A crashed worker is released here.
    pImpl->release_process();

    const auto &spec = pImpl->spec;
    if (spec.argv.empty() || spec.argv.front().empty())
    {
        LOGGER_ERROR("ProcessSupervisor: no worker command configured");
        return R::error(ProcessError::ProcessSpawnError, EINVAL);
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->state = WorkerState::Starting;
        pImpl->exited = false;
        pImpl->abandon.store(false, std::memory_order_release);
        pImpl->scanner.reset(spec.ready_markers);
        pImpl->out_lines = LineSplitter{};
        pImpl->err_lines = LineSplitter{};
    }

    // Fork/exec and the monitor thread start without the state lock; spawn() publishes the
    // handle under it.
    int sys_error = 0;
    if (!pImpl->spawn(sys_error))
    {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            pImpl->state = WorkerState::Stopped;
        }
        LOGGER_ERROR("ProcessSupervisor: failed to spawn '{}': {}", spec.argv.front(),
                     std::error_code(sys_error, std::generic_category()).message());
        return R::error(ProcessError::ProcessSpawnError, sys_error);
    }

    std::unique_lock<std::mutex> lock(pImpl->mutex);
    LOGGER_INFO("ProcessSupervisor: spawned '{}' as pid {}, waiting up to {} ms for readiness",
                spec.argv.front(), pImpl->handle.pid, spec.start_timeout.count());
    const bool settled = pImpl->cv.wait_for(lock, spec.start_timeout,
                                            [this] { return pImpl->state != WorkerState::Starting; });
    if (!settled)
    {
        // The worker may still come up or hang around; stop() reaps it.
        pImpl->state = WorkerState::Crashed;
        LOGGER_ERROR("ProcessSupervisor: worker pid {} printed no readiness marker within {} ms",
                     pImpl->handle.pid, spec.start_timeout.count());
        return R::error(ProcessError::ProcessStartTimeout);
    }
    if (pImpl->state == WorkerState::Ready)
        return R::ok(std::monostate{});

    const int code = pImpl->last_exit_code.value_or(-1);
    LOGGER_ERROR("ProcessSupervisor: worker exited with code {} before becoming ready", code);
    return R::error(ProcessError::ProcessCrashed, code);
}

void ProcessSupervisor::stop() noexcept
{
    try
    {
        std::lock_guard<std::mutex> op(pImpl->op_mutex);
        std::unique_lock<std::mutex> lock(pImpl->mutex);
        if (!pImpl->has_process)
        {
            pImpl->state = WorkerState::Stopped;
            return;
        }

        if (!pImpl->exited)
        {
            pImpl->state = WorkerState::Stopping;
            const ProcessHandle h = pImpl->handle;
            const auto grace = pImpl->spec.stop_grace;
            lock.unlock();

            LOGGER_INFO("ProcessSupervisor: stopping worker pid {} ({})", h.pid,
                        pImpl->terminator->name());
            if (auto ec = pImpl->terminator->request_graceful(h))
            {
                if (ec == std::errc::no_such_process)
                    LOGGER_DEBUG("ProcessSupervisor: pid {} already gone", h.pid);
                else
                    LOGGER_WARN("ProcessSupervisor: graceful stop of pid {} failed: {}", h.pid,
                                ec.message());
            }

            lock.lock();
            if (!pImpl->cv.wait_for(lock, grace, [this] { return pImpl->exited; }))
            {
                lock.unlock();
                LOGGER_WARN("ProcessSupervisor: pid {} still running after {} ms; killing", h.pid,
                            grace.count());
                if (auto ec = pImpl->terminator->force_kill(h))
                {
                    if (ec == std::errc::no_such_process)
                        LOGGER_DEBUG("ProcessSupervisor: pid {} already gone", h.pid);
                    else
                        LOGGER_ERROR("ProcessSupervisor: kill of pid {} failed: {}", h.pid,
                                     ec.message());
                }
                lock.lock();
                if (!pImpl->cv.wait_for(lock, kReapWait, [this] { return pImpl->exited; }))
                {
                    LOGGER_ERROR("ProcessSupervisor: pid {} did not exit after kill", h.pid);
                    pImpl->abandon.store(true, std::memory_order_release);
                }
            }
        }
        lock.unlock();

        pImpl->release_process();
        lock.lock();
        pImpl->state = WorkerState::Stopped;
        LOGGER_INFO("ProcessSupervisor: worker stopped");
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("ProcessSupervisor: stop() failed: {}", e.what());
    }
}

bool ProcessSupervisor::is_running() const noexcept
{
    return state() == WorkerState::Ready;
}

WorkerState ProcessSupervisor::state() const noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->state;
}

std::optional<int> ProcessSupervisor::last_exit_code() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->last_exit_code;
}

int64_t ProcessSupervisor::pid() const noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->has_process ? pImpl->handle.pid : 0;
}

void ProcessSupervisor::set_exit_callback(ExitCallback cb)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->on_exit = std::move(cb);
}

const WorkerLaunchSpec &ProcessSupervisor::spec() const noexcept
{
    return pImpl->spec;
}

} // namespace syncdesk::sync
