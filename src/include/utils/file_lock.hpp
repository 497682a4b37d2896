#pragma once
/**
 * @file file_lock.hpp
 * @brief Cross-process advisory lock guarding a persisted file.
 *
 * The lock is held on a sidecar file `<target>.lock`, never on the target itself, so the
 * target can be atomically replaced while locked. Two levels of exclusion are combined:
 *
 * - within a process, a registry keyed by the normalized lock path serializes threads (OS
 *   advisory locks are per-process on most platforms and would not exclude them);
 * - across processes, `flock(LOCK_EX)` on POSIX and `LockFileEx` on Windows.
 *
 * Acquisition failure is never an exception: check `valid()` / `error_code()` on a
 * constructed lock, or the optional returned by `try_lock()`.
 *
 * FileLock is a lifecycle module; constructing one before the module started is a panic.
 */
#include "sd_base.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

namespace syncdesk::utils
{

enum class LockMode
{
    Blocking,
    NonBlocking
};

struct FileLockImpl;

class SYNCDESK_UTILS_EXPORT FileLock
{
  public:
    /// Blocking acquires or waits forever; NonBlocking fails at once if held.
    FileLock(const std::filesystem::path &target, LockMode mode) noexcept;
    /// Waits up to `timeout`; on expiry `error_code()` is `errc::timed_out`.
    FileLock(const std::filesystem::path &target, std::chrono::milliseconds timeout) noexcept;

    ~FileLock();
    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    [[nodiscard]] static std::optional<FileLock> try_lock(const std::filesystem::path &target,
                                                          LockMode mode) noexcept;
    [[nodiscard]] static std::optional<FileLock> try_lock(const std::filesystem::path &target,
                                                          std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;
    [[nodiscard]] std::optional<std::filesystem::path> lock_file_path() const noexcept;

    /// `<absolute normalized target>.lock`, or empty for an unusable path.
    [[nodiscard]] static std::filesystem::path
    lock_path_for(const std::filesystem::path &target) noexcept;

    static ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

  private:
    FileLock() noexcept;

    struct FileLockImplDeleter
    {
        void operator()(FileLockImpl *ptr);
    };
    std::unique_ptr<FileLockImpl, FileLockImplDeleter> pImpl;
};

} // namespace syncdesk::utils
