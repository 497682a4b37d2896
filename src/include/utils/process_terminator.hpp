#pragma once
/**
 * @file process_terminator.hpp
 * @brief Platform policy for ending the supervised worker process.
 *
 * The supervisor always asks politely first and escalates after its grace period; how each of
 * the two requests reaches the process differs per platform:
 *
 * - `SignalTerminator` (POSIX): `SIGTERM`, then `SIGKILL`, both sent to the worker's process
 *   group so helpers it forked go down with it.
 * - `TaskkillTerminator` (Windows): `taskkill /pid <pid> /t`, then `taskkill /pid <pid> /f /t`,
 *   which walk the process tree.
 */
#include "sd_base.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace syncdesk::sync
{

/// Opaque reference to a spawned process. `native` is the Windows process HANDLE.
struct ProcessHandle
{
    int64_t pid{0};
    void *native{nullptr};
};

class SYNCDESK_UTILS_EXPORT ProcessTerminator
{
  public:
    virtual ~ProcessTerminator() = default;

    /**
     * @brief Asks the process (tree) to exit.
     * @return `errc::no_such_process` if it is already gone, another error on failure.
     */
    virtual std::error_code request_graceful(const ProcessHandle &handle) = 0;

    /// Kills the process (tree) without giving it a chance to clean up.
    virtual std::error_code force_kill(const ProcessHandle &handle) = 0;

    [[nodiscard]] virtual const char *name() const noexcept = 0;
};

#if defined(SYNCDESK_IS_POSIX)
class SYNCDESK_UTILS_EXPORT SignalTerminator final : public ProcessTerminator
{
  public:
    std::error_code request_graceful(const ProcessHandle &handle) override;
    std::error_code force_kill(const ProcessHandle &handle) override;
    [[nodiscard]] const char *name() const noexcept override { return "signal"; }
};
#endif

#if defined(SYNCDESK_PLATFORM_WIN64)
class SYNCDESK_UTILS_EXPORT TaskkillTerminator final : public ProcessTerminator
{
  public:
    std::error_code request_graceful(const ProcessHandle &handle) override;
    std::error_code force_kill(const ProcessHandle &handle) override;
    [[nodiscard]] const char *name() const noexcept override { return "taskkill"; }
};
#endif

/// The terminator matching the build platform.
SYNCDESK_UTILS_EXPORT std::unique_ptr<ProcessTerminator> make_platform_terminator();

} // namespace syncdesk::sync
