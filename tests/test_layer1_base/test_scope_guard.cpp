/**
 * @file test_scope_guard.cpp
 * @brief Layer 1 tests for ScopeGuard.
 */
#include "bmc_base.hpp"
#include "test_patterns.h"
#include <gtest/gtest.h>
#include <stdexcept>

using bmapcopy::basics::make_scope_guard;

class ScopeGuardTest : public bmapcopy::tests::PureApiTest
{
};

TEST_F(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() { ++calls; });
        EXPECT_TRUE(static_cast<bool>(guard));
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(ScopeGuardTest, DismissPreventsExecution)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 0);
}

TEST_F(ScopeGuardTest, InvokeRunsOnce)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() { ++calls; });
        guard.invoke();
        guard.invoke();
        EXPECT_EQ(calls, 1);
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(ScopeGuardTest, MoveTransfersOwnership)
{
    int calls = 0;
    {
        auto a = make_scope_guard([&]() { ++calls; });
        auto b = std::move(a);
        EXPECT_TRUE(static_cast<bool>(b));
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(ScopeGuardTest, InvokeDropsStdException)
{
    auto guard = make_scope_guard([]() { throw std::runtime_error("boom"); });
    EXPECT_NO_THROW(guard.invoke());
}

TEST_F(ScopeGuardTest, InvokeAndRethrowPropagates)
{
    int calls = 0;
    auto guard = make_scope_guard(
        [&]()
        {
            ++calls;
            throw std::runtime_error("boom");
        });
    EXPECT_THROW(guard.invoke_and_rethrow(), std::runtime_error);
    EXPECT_FALSE(static_cast<bool>(guard));
    EXPECT_EQ(calls, 1);
}
