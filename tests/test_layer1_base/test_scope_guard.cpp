/**
 * @file test_scope_guard.cpp
 * @brief Layer 1 tests for basics::ScopeGuard.
 */
#include "sd_base.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

using syncdesk::basics::make_scope_guard;

TEST(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        EXPECT_TRUE(static_cast<bool>(guard));
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, RunsDuringUnwinding)
{
    int calls = 0;
    try
    {
        auto guard = make_scope_guard([&] { ++calls; });
        throw std::runtime_error("request failed");
    }
    catch (const std::runtime_error &)
    {
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DismissSkipsAction)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&] { ++calls; });
        guard.invoke();
        guard.invoke();
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, MoveTransfersOwnership)
{
    int calls = 0;
    {
        auto first = make_scope_guard([&] { ++calls; });
        {
            auto second = std::move(first);
            EXPECT_FALSE(static_cast<bool>(first));
            EXPECT_TRUE(static_cast<bool>(second));
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, ThrowingActionIsContainedByDestructor)
{
    bool ran = false;
    EXPECT_NO_THROW({
        auto guard = make_scope_guard(
            [&]
            {
                ran = true;
                throw std::runtime_error("cleanup failed");
            });
    });
    EXPECT_TRUE(ran);
}

TEST(ScopeGuardTest, InvokeAndRethrowPropagates)
{
    auto guard = make_scope_guard([] { throw std::runtime_error("rollback failed"); });
    EXPECT_THROW(guard.invoke_and_rethrow(), std::runtime_error);
    EXPECT_FALSE(static_cast<bool>(guard));
}
