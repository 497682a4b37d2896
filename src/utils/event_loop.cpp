#include "sd_base.hpp"
#include "utils/event_loop.hpp"
#include "utils/logger.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace syncdesk::utils
{

namespace
{
using Clock = std::chrono::steady_clock;

struct Timer
{
    EventLoop::Task task;
    std::chrono::milliseconds interval{0}; // 0: one-shot
};
} // namespace

struct EventLoop::Impl
{
    std::string name;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> ready;
    // Deadline-ordered; ties keep insertion order.
    std::multimap<Clock::time_point, TimerId> deadlines;
    std::unordered_map<TimerId, Timer> timers;
    TimerId next_id{1};
    bool stopping{false};
    std::thread worker;
    std::thread::id worker_id;

    void run();
    TimerId add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                      Task task);
    void run_task(const Task &task) const;
};

void EventLoop::Impl::run_task(const Task &task) const
{
    try
    {
        task();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("EventLoop[{}]: task threw: {}", name, e.what());
    }
}

void EventLoop::Impl::run()
{
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopping)
    {
        if (!ready.empty())
        {
            Task task = std::move(ready.front());
            ready.pop_front();
            lock.unlock();
            run_task(task);
            lock.lock();
            continue;
        }

        if (!deadlines.empty())
        {
            auto first = deadlines.begin();
            if (first->first <= Clock::now())
            {
                const TimerId id = first->second;
                deadlines.erase(first);
                auto it = timers.find(id);
                if (it == timers.end())
                    continue; // cancelled
                Task task = it->second.task;
                if (it->second.interval.count() > 0)
                {
                    deadlines.emplace(Clock::now() + it->second.interval, id);
                }
                else
                {
                    timers.erase(it);
                }
                lock.unlock();
                run_task(task);
                lock.lock();
                continue;
            }
            cv.wait_until(lock, first->first);
        }
        else
        {
            cv.wait(lock);
        }
    }
}

EventLoop::TimerId EventLoop::Impl::add_timer(std::chrono::milliseconds delay,
                                              std::chrono::milliseconds interval, Task task)
{
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping)
            return 0;
        id = next_id++;
        timers.emplace(id, Timer{std::move(task), interval});
        deadlines.emplace(Clock::now() + delay, id);
    }
    cv.notify_one();
    return id;
}

EventLoop::EventLoop(std::string name) : pImpl(std::make_unique<Impl>())
{
    pImpl->name = std::move(name);
    pImpl->worker = std::thread([impl = pImpl.get()] { impl->run(); });
    pImpl->worker_id = pImpl->worker.get_id();
}

EventLoop::~EventLoop()
{
    if (running_in_loop())
    {
        SD_PANIC("EventLoop[{}] destroyed from one of its own tasks.", pImpl->name);
    }
    stop();
}

bool EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping)
            return false;
        pImpl->ready.push_back(std::move(task));
    }
    pImpl->cv.notify_one();
    return true;
}

EventLoop::TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, Task task)
{
    return pImpl->add_timer(delay, std::chrono::milliseconds(0), std::move(task));
}

EventLoop::TimerId EventLoop::schedule_every(std::chrono::milliseconds interval, Task task)
{
    if (interval.count() <= 0)
        interval = std::chrono::milliseconds(1);
    return pImpl->add_timer(interval, interval, std::move(task));
}

bool EventLoop::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    // The stale deadline entry is skipped by run().
    return pImpl->timers.erase(id) > 0;
}

void EventLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stopping = true;
        pImpl->ready.clear();
        pImpl->deadlines.clear();
        pImpl->timers.clear();
    }
    pImpl->cv.notify_all();
    if (running_in_loop())
        return;
    if (pImpl->worker.joinable())
        pImpl->worker.join();
}

bool EventLoop::running_in_loop() const noexcept
{
    return std::this_thread::get_id() == pImpl->worker_id;
}

bool EventLoop::is_running() const noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return !pImpl->stopping;
}

} // namespace syncdesk::utils
