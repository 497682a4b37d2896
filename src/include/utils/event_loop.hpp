#pragma once
/**
 * @file event_loop.hpp
 * @brief A single thread that runs posted tasks and timers in order.
 *
 * Used wherever work must leave the caller's thread: cache-change notifications, peer-wait
 * timeouts, periodic polls. Tasks run one at a time on the loop thread; an exception thrown by a
 * task is logged and does not stop the loop.
 *
 * Timers are identified by a `TimerId`. `cancel()` from the loop thread is always effective;
 * from another thread it prevents every future run but cannot interrupt one in progress.
 */
#include "sd_base.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::utils
{

class SYNCDESK_UTILS_EXPORT EventLoop
{
  public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    /// Starts the loop thread. `name` only appears in log messages.
    explicit EventLoop(std::string name = "event-loop");
    /// Stops the loop; pending tasks are discarded.
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    /// Returns false if the loop is stopped.
    bool post(Task task);
    /// Returns 0 if the loop is stopped.
    TimerId schedule_after(std::chrono::milliseconds delay, Task task);
    /// First run after `interval`, then every `interval` until cancelled.
    TimerId schedule_every(std::chrono::milliseconds interval, Task task);
    /// Returns true if the timer was still pending or repeating.
    bool cancel(TimerId id);

    /// Joins the loop thread. Safe to call more than once; a no-op from the loop thread itself.
    void stop();

    [[nodiscard]] bool running_in_loop() const noexcept;
    [[nodiscard]] bool is_running() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace syncdesk::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
