#pragma once
/**
 * @file logger.hpp
 * @brief Asynchronous, lifecycle-managed logger.
 *
 * Callers format on their own thread into a `fmt::memory_buffer`; the buffer is queued and a
 * single worker thread writes it to the current sink (console or file). Sink switches, flushes
 * and error-callback changes travel through the same queue, so they are ordered with respect to
 * the messages around them.
 *
 * The Logger is a lifecycle module. Before `LifecycleGuard` has started it, the `LOGGER_*`
 * macros are silent no-ops, while the configuration methods abort with a panic.
 *
 * The queue is bounded: past `max_queue_size` log messages are dropped (control commands are
 * still accepted up to twice that size) and a summary of the drop is written once the worker
 * catches up.
 */
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "sd_base.hpp"

#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::utils
{

class SYNCDESK_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
    ~Logger();

    static ModuleDef GetLifecycleModule();
    /// True once the lifecycle has started the logger (stays true after shutdown).
    static bool lifecycle_initialized() noexcept;

    // --- Sinks ---
    // Both calls block until the worker has switched (or failed to switch) the sink.

    bool set_console();
    /**
     * @param use_flock Bracket each write with an advisory lock so that several processes
     *                  (the host and a test worker, for instance) can share one file.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    void flush();
    void shutdown();

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// Invoked from a dispatcher thread when a sink cannot be created or written.
    void set_write_error_callback(std::function<void(const std::string &)> cb);
    /// Toggles the SYSTEM messages written around a sink switch.
    void set_log_sink_messages_enabled(bool enabled);

    void set_max_queue_size(size_t max_size);
    [[nodiscard]] size_t get_max_queue_size() const;
    [[nodiscard]] size_t get_total_dropped_since_sink_switch() const;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, const Args &...args) noexcept;

    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, args...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, args...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, args...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, const Args &...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, args...);
    }

    /**
     * @brief Writes straight to the sink from the calling thread, bypassing the queue.
     *
     * For the last words of a crashing component. Returns false if the message was not
     * written.
     */
    bool write_sync(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;

  private:
    Logger();

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;
    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *);
    friend void do_logger_shutdown(const char *);
};

// 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;
        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            (void)enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            (void)enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, const Args &...args) noexcept
{
    if (static_cast<int>(lvl) < LOGGER_COMPILE_LEVEL || !should_log(lvl))
        return;
    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::vformat_to(std::back_inserter(mb), fmt_str, fmt::make_format_args(args...));
        (void)enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        (void)enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

} // namespace syncdesk::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::syncdesk::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::syncdesk::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::syncdesk::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::syncdesk::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::syncdesk::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::syncdesk::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::syncdesk::utils::Logger::instance().debug_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::syncdesk::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::syncdesk::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::syncdesk::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
