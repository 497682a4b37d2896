/**
 * @file syncdesk_main.cpp
 * @brief syncdesk: headless host of the time-tracking sync engine.
 *
 * ## Usage
 *
 *     syncdesk [--config-dir <dir>] [--token <token>] [--no-worker]   # Run until SIGINT/SIGTERM
 *     syncdesk --once [...]                                          # Fetch every cache once; exit 0/1
 *     syncdesk --version | --help
 *
 * Startup: lifecycle (Logger, FileLock, ClientConfig), logging settings, the local API worker,
 * then transport, auth session, scheduler, cache channel and registry. Polling timers and the
 * one-second session tick run on one EventLoop.
 *
 * Shutdown: the first SIGINT/SIGTERM stops the loop, the scheduler and the worker in that order;
 * a second one exits immediately.
 */
#include "sd_sync.hpp"
#include "syncdesk_version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace syncdesk;
using namespace syncdesk::sync;

// ---------------------------------------------------------------------------
// Global shutdown flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // double signal: fast exit
    g_shutdown.store(true, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct HostArgs
{
    std::string config_dir;
    std::string token;
    bool no_worker{false};
    bool once{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " [--config-dir <dir>] [--token <token>] [--no-worker] [--once]\n\n"
              << "Options:\n"
              << "  --config-dir <dir>  Directory holding client.default.json / client.user.json\n"
              << "  --token <token>     Bearer token of an existing session\n"
              << "  --no-worker         Do not start the local API worker\n"
              << "  --once              Fetch every cache once, print the counts and exit\n"
              << "  --version           Print the version and exit\n"
              << "  --help              Show this message\n";
}

HostArgs parse_args(int argc, char *argv[])
{
    HostArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--version")
        {
            std::cout << "syncdesk " << SYNCDESK_VERSION_STRING << "\n";
            std::exit(0);
        }
        if (arg == "--config-dir" && i + 1 < argc)
        {
            args.config_dir = argv[++i];
        }
        else if (arg == "--token" && i + 1 < argc)
        {
            args.token = argv[++i];
        }
        else if (arg == "--no-worker")
        {
            args.no_worker = true;
        }
        else if (arg == "--once")
        {
            args.once = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

utils::Logger::Level level_from_name(const std::string &name)
{
    if (name == "trace")
        return utils::Logger::Level::L_TRACE;
    if (name == "debug")
        return utils::Logger::Level::L_DEBUG;
    if (name == "warn" || name == "warning")
        return utils::Logger::Level::L_WARNING;
    if (name == "error")
        return utils::Logger::Level::L_ERROR;
    if (name == "system")
        return utils::Logger::Level::L_SYSTEM;
    return utils::Logger::Level::L_INFO;
}

void apply_logging(const LoggingSettings &logging)
{
    auto &logger = utils::Logger::instance();
    logger.set_level(level_from_name(logging.level));
    if (!logging.file.empty() && !logger.set_logfile(logging.file.string()))
        LOGGER_ERROR("syncdesk: cannot log to '{}'; staying on the console", logging.file.string());
}

std::shared_ptr<CacheChannel> make_channel(const CacheSettings &cache)
{
    if (cache.channel != "file")
        return std::make_shared<InProcessCacheChannel>();
    auto path = cache.channel_path;
    if (path.empty())
        path = std::filesystem::temp_directory_path() / "syncdesk" / "cache.json";
    LOGGER_INFO("syncdesk: sharing caches through '{}'", path.string());
    return std::make_shared<FileCacheChannel>(path, cache.poll_interval);
}

const std::vector<std::string> kEntityTypes = {Project::kEntityType,   Client::kEntityType,
                                               TimeEntry::kEntityType, Screenshot::kEntityType,
                                               Settings::kEntityType,  Organization::kEntityType};

/// --once: fetch every entity type, print `<type> <count>` per line.
int run_once(CacheRegistry &registry)
{
    std::vector<std::pair<std::string, FetchFuture>> fetches;
    for (const auto &type : kEntityTypes)
        fetches.emplace_back(type, registry.fetch(type, true));

    int rc = 0;
    for (auto &[type, future] : fetches)
    {
        const auto &result = future.get();
        if (result.is_ok())
        {
            std::cout << type << " " << result.content().size() << "\n";
        }
        else
        {
            std::cout << type << " error: " << result.error().describe() << "\n";
            rc = 1;
        }
    }
    return rc;
}

/// Polls the running time entry and feeds the session tracker.
void poll_current_entry(SyncTaskScheduler &scheduler, ActiveSessionTracker &session)
{
    scheduler.send(endpoints::current_time_entry(), TaskKind::Fetch, TimeEntry::kEntityType,
                   [&session](const TaskResult &r)
                   {
                       if (!r.is_ok())
                           return;
                       std::optional<TimeEntry> running;
                       try
                       {
                           running = running_time_entry(r.content());
                       }
                       catch (const nlohmann::json::exception &e)
                       {
                           LOGGER_WARN("syncdesk: unreadable current time entry: {}", e.what());
                           return;
                       }
                       if (!running)
                       {
                           if (session.snapshot().is_active &&
                               !session.snapshot().awaiting_confirmation)
                               session.confirm_stop();
                           return;
                       }
                       if (auto start = ClockNormalizer::parse_timestamp(running->start_time))
                           session.adopt_server_session(running->id, *start);
                   });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const HostArgs args = parse_args(argc, argv);
    if (!args.config_dir.empty())
        ClientConfig::set_config_dir(args.config_dir);

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    utils::LifecycleGuard host_lifecycle(utils::MakeModDefList(
        utils::Logger::GetLifecycleModule(), utils::FileLock::GetLifecycleModule(),
        ClientConfig::GetLifecycleModule()));

    const ClientSettings &cfg = ClientConfig::instance().settings();
    apply_logging(cfg.logging);
    LOGGER_INFO("syncdesk {} starting (config: '{}')", SYNCDESK_VERSION_STRING,
                ClientConfig::instance().config_dir().string());

    // ── Local API worker ──────────────────────────────────────────────────────
    std::unique_ptr<ProcessSupervisor> worker;
    if (!args.no_worker)
    {
        worker = std::make_unique<ProcessSupervisor>(WorkerLaunchSpec::from_settings(cfg.worker));
        worker->set_exit_callback(
            [](int code) { LOGGER_ERROR("syncdesk: worker exited unexpectedly (code {})", code); });
        auto started = worker->start();
        if (!started.is_ok())
        {
            LOGGER_ERROR("syncdesk: worker did not start: {}", to_string(started.error()));
            worker->stop();
            return 1;
        }
    }

    // ── Sync engine ───────────────────────────────────────────────────────────
    auto transport = std::make_shared<CurlTransport>(cfg.remote.base_url, cfg.remote.request_timeout);
    auto auth = std::make_shared<AuthSession>(cfg.sync.auth_cooldown);
    if (!args.token.empty())
        auth->set_token(args.token);
    auth->set_on_expired([] { LOGGER_WARN("syncdesk: session expired; sign in again"); });

    auto scheduler = std::make_shared<SyncTaskScheduler>(transport, auth, EndpointCatalog{},
                                                         SchedulerConfig::from_settings(cfg.sync));
    auto channel = make_channel(cfg.cache);
    int rc = 0;
    {
        CacheRegistry registry(scheduler, channel, RegistryConfig::from_settings(cfg.cache));
        for (const auto &type : kEntityTypes)
            registry.register_entity(type);

        if (args.once)
        {
            rc = run_once(registry);
        }
        else
        {
            ClockConfig clock_cfg;
            clock_cfg.skew_threshold = cfg.clock.skew_threshold;
            clock_cfg.policy = cfg.clock.policy == "clamp" ? SkewPolicy::ClampFutureToNow
                                                           : SkewPolicy::RebaseWholeHours;
            ClockNormalizer clock(clock_cfg);
            ActiveSessionTracker session(clock, cfg.clock.session_tolerance);

            utils::EventLoop loop("syncdesk-main");
            loop.schedule_every(std::chrono::duration_cast<std::chrono::milliseconds>(
                                    cfg.polling.time_entries),
                                [&]
                                {
                                    registry.invalidate(TimeEntry::kEntityType);
                                    (void)registry.fetch(TimeEntry::kEntityType);
                                    poll_current_entry(*scheduler, session);
                                });
            loop.schedule_every(
                std::chrono::duration_cast<std::chrono::milliseconds>(cfg.polling.sync_status),
                [&]
                {
                    scheduler->send(endpoints::sync_status(), TaskKind::Fetch, "sync",
                                    [](const TaskResult &r)
                                    {
                                        if (r.is_ok())
                                            LOGGER_DEBUG("syncdesk: sync status {}",
                                                         r.content().dump());
                                    });
                });
            loop.schedule_every(std::chrono::seconds(1),
                                [&]
                                {
                                    if (session.snapshot().is_active)
                                        LOGGER_TRACE("syncdesk: session running for {} s",
                                                     session.elapsed_seconds());
                                });

            for (const auto &type : kEntityTypes)
                (void)registry.fetch(type);
            poll_current_entry(*scheduler, session);

            LOGGER_INFO("syncdesk: running. Send SIGINT or SIGTERM to stop.");
            while (!g_shutdown.load(std::memory_order_relaxed))
            {
                if (worker && !worker->is_running() &&
                    worker->state() == WorkerState::Crashed)
                {
                    LOGGER_ERROR("syncdesk: worker crashed; shutting down");
                    rc = 1;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            LOGGER_INFO("syncdesk: shutdown requested");
            loop.stop();
            // Completions still queued reference `session`.
            scheduler->shutdown();
        }
        scheduler->shutdown();
    }

    if (worker)
        worker->stop();
    LOGGER_INFO("syncdesk: stopped");
    return rc;
}
