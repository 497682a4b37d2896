/**
 * @file test_platform_debug.cpp
 * @brief Layer 0 tests for debug messages, source locations, stack traces and SD_PANIC.
 *
 * Stack traces are captured by redirecting the stderr descriptor to a file; on Windows the
 * symbol handler may write to stderr while it initializes, which rules out a pipe.
 */
#include "sd_base.hpp"
#include "shared_test_helpers.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#if defined(SYNCDESK_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

using namespace syncdesk::debug;
using namespace ::testing;

namespace
{

/// Runs `fn` with stderr sent to `path`; returns what was written.
template <typename Fn> std::string capture_stderr_to_file(const fs::path &path, Fn fn)
{
    std::fflush(stderr);
#if defined(SYNCDESK_PLATFORM_WIN64)
    FILE *redirected = std::freopen(path.string().c_str(), "w", stderr);
    EXPECT_NE(redirected, nullptr);
    fn();
    std::fflush(stderr);
    (void)std::freopen("CON", "w", stderr);
#else
    const int saved = ::dup(::fileno(stderr));
    const int fd = ::open(path.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    EXPECT_NE(fd, -1);
    ::dup2(fd, ::fileno(stderr));
    ::close(fd);
    fn();
    std::fflush(stderr);
    ::dup2(saved, ::fileno(stderr));
    ::close(saved);
#endif
    std::string out;
    EXPECT_TRUE(syncdesk::tests::helper::read_file_contents(path.string(), out));
    return out;
}

[[noreturn]] void panic_plain()
{
    SD_PANIC("worker state corrupted");
}

[[noreturn]] void panic_formatted()
{
    SD_PANIC("cache '{}' lost {} pending mutations", "projects", 3);
}

} // namespace

TEST(PlatformDebugTest, DebugMsg_PrefixedAndFormatted)
{
    syncdesk::tests::helper::TempDir dir("debug_msg");
    const auto out = capture_stderr_to_file(dir / "dbg.log",
                                            [] { debug_msg("retry {} of {}", 2, 5); });
    EXPECT_THAT(out, HasSubstr("[DBG]"));
    EXPECT_THAT(out, HasSubstr("retry 2 of 5"));
}

TEST(PlatformDebugTest, DebugMsgRt_BadFormatReportedNotThrown)
{
    syncdesk::tests::helper::TempDir dir("debug_msg_rt");
    const std::string fmt_str = "missing {} {}";
    const auto out =
        capture_stderr_to_file(dir / "dbg.log", [&] { debug_msg_rt(fmt_str, 1); });
    EXPECT_THAT(out, HasSubstr("FATAL FORMAT ERROR"));
}

TEST(PlatformDebugTest, SourceLocation_NamesThisFile)
{
    const std::string here = SD_LOC_HERE_STR;
    EXPECT_THAT(here, HasSubstr("test_platform_debug.cpp"));
    EXPECT_THAT(here, ContainsRegex(":[0-9]+"));
}

TEST(PlatformDebugTest, StackTrace_HasHeader)
{
    syncdesk::tests::helper::TempDir dir("stack_trace");
    const auto out = capture_stderr_to_file(dir / "trace.log", [] { print_stack_trace(); });
    EXPECT_THAT(out, HasSubstr("Stack Trace (most recent call first):"));
}

TEST(PlatformDebugTest, Panic_AbortsWithLocationAndTrace)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(panic_plain(), AllOf(HasSubstr("[PANIC]"), HasSubstr("test_platform_debug.cpp"),
                                      HasSubstr("worker state corrupted"),
                                      HasSubstr("Stack Trace (most recent call first):")));
}

TEST(PlatformDebugTest, Panic_FormatsArguments)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(panic_formatted(), HasSubstr("cache 'projects' lost 3 pending mutations"));
}
