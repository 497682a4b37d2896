/**
 * @file logger_workers.cpp
 * @brief Logger scenarios. Each owns the Logger lifecycle of its process.
 */
#include "logger_workers.h"

#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace syncdesk::utils;
using namespace syncdesk::tests::helper;
using namespace ::testing;
using namespace std::chrono_literals;

namespace
{

std::string read_log(const std::string &path)
{
    std::string contents;
    EXPECT_TRUE(read_file_contents(path, contents)) << path;
    return contents;
}

} // namespace

namespace syncdesk::tests::worker::logger
{

int file_sink_writes_levels(const std::string &log_path)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            ASSERT_TRUE(log.set_logfile(log_path));
            log.set_level(Logger::Level::L_TRACE);

            LOGGER_TRACE("trace {}", 1);
            LOGGER_DEBUG("debug {}", 2);
            LOGGER_INFO("sync finished: {} projects", 12);
            LOGGER_WARN("retrying '{}'", "/api/clients");
            LOGGER_ERROR("worker exited with {}", 3);
            LOGGER_SYSTEM("system line");
            log.flush();

            const auto text = read_log(log_path);
            EXPECT_THAT(text, HasSubstr("[TRACE ]"));
            EXPECT_THAT(text, HasSubstr("[DEBUG ]"));
            EXPECT_THAT(text, HasSubstr("[INFO  ] "));
            EXPECT_THAT(text, HasSubstr("sync finished: 12 projects"));
            EXPECT_THAT(text, HasSubstr("retrying '/api/clients'"));
            EXPECT_THAT(text, HasSubstr("worker exited with 3"));
            EXPECT_THAT(text, HasSubstr(fmt::format("PID:{:5}", syncdesk::platform::get_pid())));
        },
        "logger::file_sink_writes_levels", Logger::GetLifecycleModule());
}

int level_filtering(const std::string &log_path)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            ASSERT_TRUE(log.set_logfile(log_path));
            log.set_level(Logger::Level::L_WARNING);
            ASSERT_EQ(log.level(), Logger::Level::L_WARNING);

            LOGGER_DEBUG("hidden-debug");
            LOGGER_INFO("hidden-info");
            LOGGER_WARN("visible-warn");
            LOGGER_ERROR("visible-error");
            log.flush();

            const auto text = read_log(log_path);
            EXPECT_THAT(text, Not(HasSubstr("hidden-debug")));
            EXPECT_THAT(text, Not(HasSubstr("hidden-info")));
            EXPECT_THAT(text, HasSubstr("visible-warn"));
            EXPECT_THAT(text, HasSubstr("visible-error"));
        },
        "logger::level_filtering", Logger::GetLifecycleModule());
}

int runtime_format_error(const std::string &log_path)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            ASSERT_TRUE(log.set_logfile(log_path));
            const std::string fmt_from_config = "entity {} changed by {}";
            LOGGER_INFO_RT(fmt_from_config, "projects");
            log.flush();

            EXPECT_THAT(read_log(log_path), HasSubstr("[FORMAT ERROR]"));
        },
        "logger::runtime_format_error", Logger::GetLifecycleModule());
}

int multithread_no_loss(const std::string &log_path, int threads, int per_thread)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            ASSERT_TRUE(log.set_logfile(log_path));
            ThreadRacer racer(threads);
            ASSERT_TRUE(racer.race(
                [per_thread](int t)
                {
                    for (int i = 0; i < per_thread; ++i)
                        LOGGER_INFO("mt-line thread={} seq={}", t, i);
                }));
            log.flush();

            const auto text = read_log(log_path);
            EXPECT_EQ(count_lines(text, "mt-line"), static_cast<size_t>(threads * per_thread));
            EXPECT_EQ(log.get_total_dropped_since_sink_switch(), 0u);
        },
        "logger::multithread_no_loss", Logger::GetLifecycleModule());
}

int append_from_process(const std::string &log_path, const std::string &tag, int count)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            log.set_log_sink_messages_enabled(false);
            ASSERT_TRUE(log.set_logfile(log_path, true));
            for (int i = 0; i < count; ++i)
                LOGGER_INFO("proc-line {} {}", tag, i);
            log.flush();
        },
        "logger::append_from_process", Logger::GetLifecycleModule());
}

int unwritable_logfile_reports(const std::string &bad_path)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            auto reported = std::make_shared<std::promise<std::string>>();
            auto once = std::make_shared<std::atomic<bool>>(false);
            log.set_write_error_callback(
                [reported, once](const std::string &msg)
                {
                    if (!once->exchange(true))
                        reported->set_value(msg);
                });

            EXPECT_FALSE(log.set_logfile(bad_path));

            auto future = reported->get_future();
            ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
            EXPECT_THAT(future.get(), HasSubstr("Failed to create FileSink"));

            // Still usable on the previous sink.
            LOGGER_INFO("after failed switch");
            log.flush();
        },
        "logger::unwritable_logfile_reports", Logger::GetLifecycleModule());
}

int queue_overflow_drops(const std::string &log_path)
{
    return run_gtest_worker(
        [&]
        {
            auto &log = Logger::instance();
            ASSERT_TRUE(log.set_logfile(log_path));
            log.set_max_queue_size(4);
            ASSERT_EQ(log.get_max_queue_size(), 4u);

            for (int i = 0; i < 20000; ++i)
                LOGGER_INFO("flood {}", i);
            log.flush();

            EXPECT_GT(log.get_total_dropped_since_sink_switch(), 0u);
            // Control commands are admitted past the log limit.
            log.set_max_queue_size(10000);
            LOGGER_INFO("after flood");
            log.flush();
            EXPECT_THAT(read_log(log_path), HasSubstr("after flood"));
        },
        "logger::queue_overflow_drops", Logger::GetLifecycleModule());
}

int use_before_init_panics()
{
    // No lifecycle: configuration calls panic; log macros alone would be silent.
    LOGGER_INFO("silently dropped");
    Logger::instance().set_level(Logger::Level::L_DEBUG);
    return 0;
}

} // namespace syncdesk::tests::worker::logger

namespace
{
struct LoggerWorkerRegistrar
{
    LoggerWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "logger")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace syncdesk::tests::worker::logger;
                if (scenario == "file_sink_writes_levels" && argc > 2)
                    return file_sink_writes_levels(argv[2]);
                if (scenario == "level_filtering" && argc > 2)
                    return level_filtering(argv[2]);
                if (scenario == "runtime_format_error" && argc > 2)
                    return runtime_format_error(argv[2]);
                if (scenario == "multithread_no_loss" && argc > 4)
                    return multithread_no_loss(argv[2], std::stoi(argv[3]), std::stoi(argv[4]));
                if (scenario == "append_from_process" && argc > 4)
                    return append_from_process(argv[2], argv[3], std::stoi(argv[4]));
                if (scenario == "unwritable_logfile_reports" && argc > 2)
                    return unwritable_logfile_reports(argv[2]);
                if (scenario == "queue_overflow_drops" && argc > 2)
                    return queue_overflow_drops(argv[2]);
                if (scenario == "use_before_init_panics")
                    return use_before_init_panics();
                fmt::print(stderr, "ERROR: Unknown logger scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LoggerWorkerRegistrar g_logger_registrar;
} // namespace
