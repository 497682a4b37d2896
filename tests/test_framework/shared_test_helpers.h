// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines SYNCDESK_IS_POSIX before any platform-conditional includes.
#include "sd_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Helpers shared by every test executable: file inspection, polling waits, scratch
 *        directories, the worker-body wrappers and ThreadRacer.
 */

#include "gtest/gtest.h"

// run_gtest_worker needs LifecycleGuard, SD_DEBUG and print_stack_trace.
#include "sd_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace syncdesk::tests::helper
{

/// Reads a whole file; false if it cannot be opened.
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of `text`, optionally only those that contain `must_include` and do not
 *        contain `must_exclude`.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/// Polls `path` until it contains `expected`.
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/// Polls `pred` every 10 ms; returns its last value.
bool wait_until(const std::function<bool()> &pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

/**
 * @brief A fresh directory under the system temp directory, removed with its contents on
 *        destruction.
 */
class TempDir
{
  public:
    explicit TempDir(const std::string &tag);
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return path_; }
    fs::path operator/(const std::string &name) const { return path_ / name; }

  private:
    fs::path path_;
};

/**
 * @brief Runs `test_logic` inside a LifecycleGuard built from `mods`.
 *
 * GoogleTest assertions throw inside workers so a failed ASSERT_* or EXPECT_* ends the worker
 * with a non-zero code and a "[WORKER FAILURE]" line on stderr.
 *
 * @return 0 on success, 1 on an assertion failure, 2 on an exception.
 */
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    syncdesk::utils::LifecycleGuard guard(
        syncdesk::utils::MakeModDefList(std::forward<Mods>(mods)...));

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        SD_DEBUG("[WORKER FAILURE] GTest assertion failed in {}: \n{}", test_name, e.what());
        syncdesk::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        SD_DEBUG("[WORKER FAILURE] {} threw an exception: {}", test_name, e.what());
        syncdesk::debug::print_stack_trace();
        return 2;
    }
    return 0;
}

/// As run_gtest_worker, without a LifecycleGuard: the body manages the lifecycle itself.
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        SD_DEBUG("[WORKER FAILURE] GTest assertion failed in {}: \n{}", test_name, e.what());
        syncdesk::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        SD_DEBUG("[WORKER FAILURE] {} threw an exception: {}", test_name, e.what());
        syncdesk::debug::print_stack_trace();
        return 2;
    }
    return 0;
}

// ============================================================================
// ThreadRacer: start N threads at once
// ============================================================================

/**
 * @brief Runs `fn(thread_index)` on N threads released together from a barrier.
 *
 * An exception thrown by a thread is captured; race() returns false if any thread threw and
 * exceptions() holds them.
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (const std::exception &)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::none_of(exceptions_.begin(), exceptions_.end(),
                            [](const std::exception_ptr &p) { return static_cast<bool>(p); });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace syncdesk::tests::helper
