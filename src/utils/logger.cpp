/*******************************************************************************
 * @file logger.cpp
 * @brief Asynchronous logger: command queue, worker thread and sink switching.
 ******************************************************************************/

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "sd_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#if defined(SYNCDESK_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

using namespace syncdesk::format_tools;

namespace syncdesk::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        SD_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{

// Creates and removes a scratch file so an unwritable log directory is reported to the caller
// instead of to the worker thread.
bool check_directory_is_writable(const std::filesystem::path &dir, std::error_code &ec)
{
    ec.clear();
    const auto probe = dir / fmt::format("syncdesk_write_check_{}.tmp",
                                         platform::monotonic_time_ns());
#if defined(SYNCDESK_PLATFORM_WIN64)
    HANDLE h = CreateFileW(probe.wstring().c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_TEMPORARY | FILE_FLAG_DELETE_ON_CLOSE, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return false;
    }
    CloseHandle(h);
#else
    int fd = ::open(probe.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    ::close(fd);
    ::unlink(probe.c_str());
#endif
    return true;
}

LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

/**
 * @class CallbackDispatcher
 * @brief Runs user callbacks (the write-error callback) on their own thread so a slow or
 *        throwing callback never stalls the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                // The callback is the error channel; stderr is all that is left.
                fmt::print(stderr, "[LOGGER] write-error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// --- Commands ---
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand, SetLogSinkMessagesCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied: the command was rejected once and retried.
    }
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(std::string msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable() && !shutdown_requested_.load())
    {
        SD_DEBUG("Logger Impl destroyed without a prior shutdown; check lifecycle management.");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

void Logger::Impl::report_error(std::string msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(msg)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[LOGGER] {}\n", msg);
    }
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if (current >= m_max_queue_size * 2 || (is_log && current >= m_max_queue_size))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration<double>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }
        }

        if (dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(Logger::Level::L_WARNING,
                                                 make_buffer("Log queue overflowed; messages "
                                                             "before this batch were dropped.")),
                             Sink::ASYNC_WRITE);
            }
        }

        // Only the last sink switch of a batch takes effect; earlier ones report false.
        std::ptrdiff_t last_set_sink_idx = -1;
        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[static_cast<size_t>(i)]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (size_t i = 0; i < local_queue.size(); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [&, this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (static_cast<std::ptrdiff_t>(i) != last_set_sink_idx)
                                promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (sink_)
                                sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                        {
                            m_log_sink_messages_enabled_.store(arg.enabled,
                                                               std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(
                                 Logger::Level::L_WARNING,
                                 make_buffer("Summary: the Logger dropped {} messages over "
                                             "{:.2f}s due to a full queue.",
                                             dropped_count, dropping_duration_s)),
                             Sink::ASYNC_WRITE);
            }
        }

        if (last_set_sink_idx != -1)
        {
            auto &sink_cmd = std::get<SetSinkCommand>(local_queue[static_cast<size_t>(last_set_sink_idx)]);
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            try
            {
                const bool announce = m_log_sink_messages_enabled_.load(std::memory_order_relaxed);
                const std::string old_desc = sink_ ? sink_->description() : "null";
                const std::string new_desc =
                    sink_cmd.new_sink ? sink_cmd.new_sink->description() : "null";
                if (announce && sink_)
                {
                    sink_->write(make_system_message(
                                     Logger::Level::L_SYSTEM,
                                     make_buffer("Switching log sink to: {}", new_desc)),
                                 Sink::ASYNC_WRITE);
                    sink_->flush();
                }
                m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                sink_ = std::move(sink_cmd.new_sink);
                if (announce && sink_)
                {
                    sink_->write(make_system_message(
                                     Logger::Level::L_SYSTEM,
                                     make_buffer("Log sink switched from: {}", old_desc)),
                                 Sink::ASYNC_WRITE);
                }
                promise_set_safe(sink_cmd.promise, true);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger sink switch error: {}", e.what()));
                promise_set_safe(sink_cmd.promise, sink_ != nullptr);
            }
        }

        local_queue.clear();

        if (shutdown_requested_.load())
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                // Messages that raced with the shutdown request are still written.
                continue;
            }
            lock.unlock();

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                                     make_buffer("Logger is shutting down.")),
                                 Sink::ASYNC_WRITE);
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    fmt::print(stderr, "[LOGGER] final write failed: {}\n", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
        return;
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    try
    {
        const auto normalized = std::filesystem::absolute(utf8_path).lexically_normal();
        const auto parent_dir = normalized.parent_path();
        std::error_code ec;
        if (!parent_dir.empty())
        {
            std::filesystem::create_directories(parent_dir, ec);
            if (ec || !check_directory_is_writable(parent_dir, ec))
            {
                throw std::runtime_error(fmt::format("log directory '{}' is not writable: {}",
                                                     parent_dir.string(), ec.message()));
            }
        }
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(
            SetSinkCommand{std::make_unique<FileSink>(normalized.string(), use_flock), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
        return;
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    // The worker may already be gone; waiting on the future would never return.
    if (pImpl->shutdown_requested_.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_loggable("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    if (!logger_is_loggable("Logger::get_max_queue_size"))
        return 0;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    if (!logger_is_loggable("Logger::get_total_dropped_since_sink_switch"))
        return 0;
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return pImpl &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    try
    {
        return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    try
    {
        return pImpl->enqueue_command(
            make_system_message(lvl, make_buffer("{}", std::move(body_str))));
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool Logger::write_sync(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
    if (!pImpl->sink_ ||
        static_cast<int>(lvl) < static_cast<int>(pImpl->level_.load(std::memory_order_relaxed)))
    {
        return false;
    }
    try
    {
        pImpl->sink_->write(make_system_message(lvl, std::move(body)), Sink::SYNC_WRITE);
        return true;
    }
    catch (const std::exception &)
    {
        // Logging the failure here would recurse.
        return false;
    }
}

// Lifecycle callbacks, called by the LifecycleManager.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        // The worker sets Shutdown on exit; force it if it never got there.
        if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            SD_DEBUG("Logger worker did not report shutdown. Forcing shutdown state.");
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
        }
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("syncdesk::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace syncdesk::utils
