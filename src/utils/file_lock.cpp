// file_lock.cpp
#include "sd_base.hpp"
#include "utils/backoff_strategy.hpp"
#include "utils/file_lock.hpp"
#include "utils/lifecycle.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

#if defined(SYNCDESK_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

static std::atomic<bool> g_filelock_initialized{false};

namespace
{
constexpr int kLockFileMode = 0644;
constexpr std::chrono::milliseconds kFileLockShutdownTimeoutMs{2000};
constexpr std::chrono::milliseconds kLockPollingInterval{20};
} // namespace

namespace syncdesk::utils
{

static std::mutex g_proc_registry_mtx;
struct ProcLockState
{
    int owners = 0;
    int waiters = 0;
    std::condition_variable cv;
};
static std::unordered_map<std::string, std::shared_ptr<ProcLockState>> g_proc_locks;

struct FileLockImpl
{
    std::filesystem::path lock_file_path;
    std::string lock_key;
    bool valid = false;
    std::error_code ec;
    std::shared_ptr<ProcLockState> proc_state;
#if defined(SYNCDESK_PLATFORM_WIN64)
    void *handle = nullptr;
#else
    int fd = -1;
#endif
};

static void release_process_local_lock(FileLockImpl *impl)
{
    std::lock_guard<std::mutex> lock_guard(g_proc_registry_mtx);
    if (!impl->proc_state)
        return;
    if (--impl->proc_state->owners == 0)
    {
        impl->proc_state->cv.notify_all();
        if (impl->proc_state->waiters == 0)
        {
            g_proc_locks.erase(impl->lock_key);
        }
    }
    impl->proc_state.reset();
}

void FileLock::FileLockImplDeleter::operator()(FileLockImpl *ptr)
{
    if (ptr == nullptr)
        return;
    if (ptr->valid)
    {
#if defined(SYNCDESK_PLATFORM_WIN64)
        if (ptr->handle != nullptr)
        {
            OVERLAPPED ov = {};
            UnlockFileEx(static_cast<HANDLE>(ptr->handle), 0, 1, 0, &ov);
            CloseHandle(static_cast<HANDLE>(ptr->handle));
            ptr->handle = nullptr;
        }
#else
        if (ptr->fd != -1)
        {
            // Unlock errors are not actionable; close() drops the lock regardless.
            (void)flock(ptr->fd, LOCK_UN);
            ::close(ptr->fd);
            ptr->fd = -1;
        }
#endif
        release_process_local_lock(ptr);
    }
    delete ptr;
}

static bool acquire_process_local_lock(FileLockImpl *impl, LockMode mode,
                                       std::optional<std::chrono::milliseconds> timeout)
{
    std::unique_lock<std::mutex> regl(g_proc_registry_mtx);
    auto &state_ref = g_proc_locks[impl->lock_key];
    if (!state_ref)
    {
        state_ref = std::make_shared<ProcLockState>();
    }
    auto state = state_ref;

    if (state->owners > 0)
    {
        if (mode == LockMode::NonBlocking)
        {
            impl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        state->waiters++;
        bool acquired = true;
        if (timeout)
        {
            acquired = state->cv.wait_for(regl, *timeout, [&] { return state->owners == 0; });
        }
        else
        {
            state->cv.wait(regl, [&] { return state->owners == 0; });
        }
        state->waiters--;
        if (!acquired)
        {
            if (state->owners == 0 && state->waiters == 0)
            {
                g_proc_locks.erase(impl->lock_key);
            }
            impl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
    }
    state->owners++;
    impl->proc_state = std::move(state);
    return true;
}

static bool run_os_lock_loop(FileLockImpl *impl, LockMode mode,
                             std::optional<std::chrono::milliseconds> timeout)
{
    const auto start_time = std::chrono::steady_clock::now();
#if defined(SYNCDESK_PLATFORM_WIN64)
    // FILE_SHARE_DELETE lets the guarded file's sidecar be removed by cleanup tools.
    HANDLE h = CreateFileW(impl->lock_file_path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        impl->ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return false;
    }
    auto guard = basics::make_scope_guard(
        [&]()
        {
            if (!impl->valid)
                CloseHandle(h);
        });

    DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
    if (mode == LockMode::NonBlocking || timeout)
        flags |= LOCKFILE_FAIL_IMMEDIATELY;

    const ConstantBackoff backoff(kLockPollingInterval);
    int attempt = 0;
    while (true)
    {
        OVERLAPPED ov = {};
        if (LockFileEx(h, flags, 0, 1, 0, &ov))
        {
            impl->handle = reinterpret_cast<void *>(h);
            impl->valid = true;
            return true;
        }
        DWORD err = GetLastError();
        impl->ec = std::error_code(static_cast<int>(err), std::system_category());
        if (mode == LockMode::NonBlocking || err != ERROR_LOCK_VIOLATION)
            return false;
        if (timeout && std::chrono::steady_clock::now() - start_time >= *timeout)
        {
            impl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        backoff(attempt++);
    }
#else
    int lock_fd = ::open(impl->lock_file_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC | O_NOFOLLOW,
                         kLockFileMode);
    if (lock_fd == -1)
    {
        impl->ec = std::error_code(errno, std::generic_category());
        return false;
    }
    auto guard = basics::make_scope_guard(
        [&]()
        {
            if (!impl->valid)
                ::close(lock_fd);
        });

    if (mode == LockMode::Blocking && !timeout)
    {
        int rc;
        do
        {
            rc = flock(lock_fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0)
        {
            impl->ec = std::error_code(errno, std::generic_category());
            return false;
        }
        impl->fd = lock_fd;
        impl->valid = true;
        return true;
    }

    const ConstantBackoff backoff(kLockPollingInterval);
    int attempt = 0;
    while (true)
    {
        if (flock(lock_fd, LOCK_EX | LOCK_NB) == 0)
        {
            impl->fd = lock_fd;
            impl->valid = true;
            return true;
        }
        const int err = errno;
        if (err != EWOULDBLOCK && err != EAGAIN && err != EINTR)
        {
            impl->ec = std::error_code(err, std::generic_category());
            return false;
        }
        if (mode == LockMode::NonBlocking)
        {
            impl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        if (timeout && std::chrono::steady_clock::now() - start_time >= *timeout)
        {
            impl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        backoff(attempt++);
    }
#endif
}

static void open_and_lock(FileLockImpl *impl, const std::filesystem::path &target, LockMode mode,
                          std::optional<std::chrono::milliseconds> timeout)
{
    impl->valid = false;
    impl->ec.clear();

    impl->lock_file_path = FileLock::lock_path_for(target);
    if (impl->lock_file_path.empty())
    {
        impl->ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    impl->lock_key = impl->lock_file_path.generic_string();

    std::error_code dir_ec;
    const auto parent = impl->lock_file_path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, dir_ec);
        if (dir_ec)
        {
            impl->ec = dir_ec;
            return;
        }
    }

    const auto start = std::chrono::steady_clock::now();
    if (!acquire_process_local_lock(impl, mode, timeout))
        return;

    // The OS lock gets what is left of the timeout.
    std::optional<std::chrono::milliseconds> remaining;
    if (timeout)
    {
        const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        remaining = spent >= *timeout ? std::chrono::milliseconds(0) : *timeout - spent;
    }
    if (!run_os_lock_loop(impl, mode, remaining))
    {
        release_process_local_lock(impl);
    }
}

std::filesystem::path FileLock::lock_path_for(const std::filesystem::path &target) noexcept
{
    try
    {
        if (target.empty())
            return {};
        constexpr int kFirstControlCharLimit = 32;
        for (const auto ch : target.native())
        {
            if (ch >= 0 && ch < kFirstControlCharLimit)
                return {};
        }
        auto lock_path = std::filesystem::absolute(target).lexically_normal();
        if (!lock_path.has_filename())
            return {};
        lock_path += ".lock";
        return lock_path;
    }
    catch (const std::exception &)
    {
        return {};
    }
}

FileLock::FileLock() noexcept : pImpl(nullptr) {}

FileLock::FileLock(const std::filesystem::path &target, LockMode mode) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (!lifecycle_initialized())
    {
        SD_PANIC("FileLock created before its module was initialized via LifecycleManager.");
    }
    if (pImpl)
        open_and_lock(pImpl.get(), target, mode, std::nullopt);
}

FileLock::FileLock(const std::filesystem::path &target, std::chrono::milliseconds timeout) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (!lifecycle_initialized())
    {
        SD_PANIC("FileLock created before its module was initialized via LifecycleManager.");
    }
    if (pImpl)
        open_and_lock(pImpl.get(), target, LockMode::Blocking, timeout);
}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->valid;
}

std::error_code FileLock::error_code() const noexcept
{
    if (!pImpl)
        return std::make_error_code(std::errc::not_enough_memory);
    return pImpl->ec;
}

std::optional<std::filesystem::path> FileLock::lock_file_path() const noexcept
{
    if (pImpl && pImpl->valid)
        return pImpl->lock_file_path;
    return std::nullopt;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &target,
                                           LockMode mode) noexcept
{
    if (!lifecycle_initialized())
        return std::nullopt;
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (!lock.pImpl)
        return std::nullopt;
    open_and_lock(lock.pImpl.get(), target, mode, std::nullopt);
    if (lock.valid())
        return {std::move(lock)};
    return std::nullopt;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &target,
                                           std::chrono::milliseconds timeout) noexcept
{
    if (!lifecycle_initialized())
        return std::nullopt;
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (!lock.pImpl)
        return std::nullopt;
    open_and_lock(lock.pImpl.get(), target, LockMode::Blocking, timeout);
    if (lock.valid())
        return {std::move(lock)};
    return std::nullopt;
}

bool FileLock::lifecycle_initialized() noexcept
{
    return g_filelock_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_filelock_startup(const char *arg)
{
    (void)arg;
    g_filelock_initialized.store(true, std::memory_order_release);
}
void do_filelock_shutdown(const char *arg)
{
    (void)arg;
    g_filelock_initialized.store(false, std::memory_order_release);
}
} // namespace

ModuleDef FileLock::GetLifecycleModule()
{
    ModuleDef module("syncdesk::utils::FileLock");
    module.set_startup(&do_filelock_startup);
    module.set_shutdown(&do_filelock_shutdown, kFileLockShutdownTimeoutMs);
    return module;
}

} // namespace syncdesk::utils
