#pragma once
/**
 * @file process_supervisor.hpp
 * @brief Owns the single local worker process that serves the data API.
 *
 * Life of the worker:
 *
 *     Stopped --start()--> Starting --marker--> Ready --stop()--> Stopping --> Stopped
 *                             |                   |
 *                             | exit / timeout    | unexpected exit
 *                             v                   v
 *                          Crashed <--------------+
 *
 * `start()` blocks until the worker prints one of the readiness markers on stdout, exits, or the
 * start timeout passes. A monitor thread owns the child's output pipes: stdout lines are logged
 * at DEBUG and scanned for markers (a marker split across reads still matches), stderr lines
 * are logged at WARN. The monitor also reaps the child.
 *
 * There is no automatic restart. After a crash the caller decides; `start()` releases the dead
 * process on its own. A worker that timed out during startup may still be alive: it blocks
 * further `start()` calls until `stop()` reaps it.
 *
 * All methods are thread-safe. `start()` and `stop()` are serialized; a `start()` issued while
 * another one is pending fails with `AlreadyRunning` rather than waiting.
 */
#include "sd_service.hpp"
#include "utils/process_terminator.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

enum class ProcessError
{
    ProcessSpawnError,
    ProcessStartTimeout,
    ProcessCrashed,
    AlreadyRunning
};

enum class WorkerState
{
    Stopped,
    Starting,
    Ready,
    Stopping,
    Crashed
};

SYNCDESK_UTILS_EXPORT const char *to_string(ProcessError e) noexcept;
SYNCDESK_UTILS_EXPORT const char *to_string(WorkerState s) noexcept;

struct SYNCDESK_UTILS_EXPORT WorkerLaunchSpec
{
    /// argv[0] is looked up on PATH when it has no directory part.
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    /// Added to (or replacing in) the parent's environment.
    std::map<std::string, std::string> env;
    std::vector<std::string> ready_markers;
    std::chrono::milliseconds start_timeout{10000};
    std::chrono::milliseconds stop_grace{3000};

    static WorkerLaunchSpec from_settings(const WorkerSettings &settings);
};

class SYNCDESK_UTILS_EXPORT ProcessSupervisor
{
  public:
    /// Called on the monitor thread with the exit code when a Ready worker dies on its own.
    using ExitCallback = std::function<void(int exit_code)>;

    /// A null terminator selects make_platform_terminator().
    explicit ProcessSupervisor(WorkerLaunchSpec spec,
                               std::unique_ptr<ProcessTerminator> terminator = nullptr);
    /// Stops the worker.
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    /**
     * @brief Spawns the worker and waits for readiness.
     *
     * Errors: `AlreadyRunning` (a worker is starting, ready, stopping, or a timed-out one is
     * still alive), `ProcessSpawnError` (the binary could not be executed; `error_code()` holds
     * the errno), `ProcessCrashed` (exited before readiness; `error_code()` holds the exit
     * code), `ProcessStartTimeout`.
     */
    utils::Status<ProcessError> start();

    /**
     * @brief Graceful termination, then a forceful kill after the grace period.
     *
     * Idempotent. Returns within about `stop_grace` plus the time the OS needs to reap a killed
     * process. Errors from a process that is already gone are logged and ignored.
     */
    void stop() noexcept;

    /// True iff the state is Ready.
    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] WorkerState state() const noexcept;
    /// Exit code of the last worker that exited; 128 + signal number for a signal death.
    [[nodiscard]] std::optional<int> last_exit_code() const;
    /// 0 when no process is held.
    [[nodiscard]] int64_t pid() const noexcept;

    void set_exit_callback(ExitCallback cb);
    [[nodiscard]] const WorkerLaunchSpec &spec() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
