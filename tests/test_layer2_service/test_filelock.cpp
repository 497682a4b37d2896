/**
 * @file test_filelock.cpp
 * @brief Layer 2 tests for FileLock: path rules in-process, locking in workers, and mutual
 *        exclusion across processes.
 */
#include "sd_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <string>

using namespace syncdesk::utils;
using namespace syncdesk::tests::helper;
using namespace ::testing;

class FileLockPathTest : public syncdesk::tests::PureApiTest
{
};

TEST_F(FileLockPathTest, LockPathIsAbsoluteSidecar)
{
    const auto p = FileLock::lock_path_for("cache/./projects.json");
    ASSERT_FALSE(p.empty());
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p.filename(), "projects.json.lock");
    EXPECT_EQ(p, fs::absolute("cache/projects.json.lock").lexically_normal());
}

TEST_F(FileLockPathTest, RejectsEmptyControlCharsAndDirectorySyntax)
{
    EXPECT_TRUE(FileLock::lock_path_for("").empty());
    EXPECT_TRUE(FileLock::lock_path_for("bad\nname").empty());
    EXPECT_TRUE(FileLock::lock_path_for("some/dir/").empty());
}

TEST_F(FileLockPathTest, TryLockWithoutLifecycleReturnsNothing)
{
    EXPECT_FALSE(FileLock::lifecycle_initialized());
    EXPECT_FALSE(FileLock::try_lock("anything.json", LockMode::NonBlocking).has_value());
}

class FileLockTest : public syncdesk::tests::IsolatedProcessTest
{
  protected:
    syncdesk::tests::helper::TempDir dir_{"filelock_test"};
    std::string target(const std::string &name) const { return (dir_ / name).string(); }
};

TEST_F(FileLockTest, NonBlockingIsExclusive)
{
    auto proc = SpawnWorker("filelock.nonblocking_exclusive", {target("a.json")});
    ExpectWorkerOk(proc);
}

TEST_F(FileLockTest, TimedLockTimesOut)
{
    auto proc = SpawnWorker("filelock.timed_lock_times_out", {target("b.json")});
    ExpectWorkerOk(proc);
}

TEST_F(FileLockTest, ThreadsAreSerialized)
{
    auto proc = SpawnWorker("filelock.threads_are_serialized", {target("c.json")});
    ExpectWorkerOk(proc);
}

TEST_F(FileLockTest, MoveKeepsLock)
{
    auto proc = SpawnWorker("filelock.move_keeps_lock", {target("d.json")});
    ExpectWorkerOk(proc);
}

TEST_F(FileLockTest, InvalidTargets)
{
    auto proc = SpawnWorker("filelock.invalid_targets", {dir_.path().string()});
    ExpectWorkerOk(proc);
}

TEST_F(FileLockTest, HeldByAnotherProcess)
{
    const auto shared = target("shared.json");
    const auto marker = dir_ / "holder.ready";
    auto holder = SpawnWorker("filelock.hold_and_signal", {shared, marker.string(), "800"});
    ASSERT_TRUE(wait_for_string_in_file(marker, "held", std::chrono::seconds(10)));

    auto contender = SpawnWorker("filelock.expect_held_elsewhere", {shared});
    ExpectWorkerOk(contender);
    ExpectWorkerOk(holder);
}

TEST_F(FileLockTest, ProcessesIncrementWithoutLostUpdates)
{
    const auto shared = target("counter.json");
    const auto counter = (dir_ / "counter.txt").string();
    std::ofstream(counter) << 0;

    auto workers = SpawnWorkers({{"filelock.increment_counter", {shared, counter, "40"}},
                                 {"filelock.increment_counter", {shared, counter, "40"}},
                                 {"filelock.increment_counter", {shared, counter, "40"}},
                                 {"filelock.increment_counter", {shared, counter, "40"}}});
    ExpectAllWorkersOk(workers);

    std::string text;
    ASSERT_TRUE(read_file_contents(counter, text));
    EXPECT_EQ(std::stoi(text), 160);
}

TEST_F(FileLockTest, UseBeforeInitPanics)
{
    auto proc = SpawnWorker("filelock.use_before_init_panics", {target("e.json")});
    EXPECT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("FileLock created before its module was initialized"));
}
