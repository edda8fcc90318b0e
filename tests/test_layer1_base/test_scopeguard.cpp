// tests/test_layer1_base/test_scopeguard.cpp
/**
 * @file test_scopeguard.cpp
 * @brief Unit tests for the ScopeGuard class.
 *
 * Covers execution on scope exit and during unwinding, dismissal, immediate
 * invocation and move semantics.
 */
#include "kbh_base.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <type_traits>

using kanbanhub::basics::make_scope_guard;
using kanbanhub::basics::ScopeGuard;

// Test that the ScopeGuard executes its function on normal scope exit.
TEST(ScopeGuardTest, ExecutesOnScopeExit)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() noexcept { executed = true; });
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

// Test that the guard runs when the scope is left by an exception.
TEST(ScopeGuardTest, ExecutesDuringUnwinding)
{
    bool executed = false;
    auto body = [&]()
    {
        auto guard = make_scope_guard([&]() noexcept { executed = true; });
        throw std::runtime_error("work failed");
    };
    EXPECT_THROW(body(), std::runtime_error);
    EXPECT_TRUE(executed);
}

// Test that a mutable lambda with internal state works as expected.
TEST(ScopeGuardTest, StatefulMutableLambda)
{
    int counter = 0;
    {
        auto guard = make_scope_guard([i = 0, &counter]() mutable noexcept {
            i++;
            counter = i;
        });
    }
    ASSERT_EQ(counter, 1);
}

TEST(ScopeGuardTest, Dismiss)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() noexcept { executed = true; });
        guard.dismiss();
        guard.dismiss(); // Second call should have no effect.
        ASSERT_FALSE(executed);
    }
    ASSERT_FALSE(executed);
}

// Test that invoke() executes the function immediately, once, and dismisses the guard.
TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int execution_count = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { execution_count++; });
        guard.invoke();
        ASSERT_EQ(execution_count, 1);
        guard.invoke(); // This call should do nothing.
        ASSERT_EQ(execution_count, 1);
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    ASSERT_EQ(execution_count, 1);
}

// Test that a moved-from ScopeGuard does not execute, so the cleanup runs exactly once.
TEST(ScopeGuardTest, MovedFromGuardIsInactive)
{
    std::atomic<int> execution_count = 0;
    {
        auto guard1 = make_scope_guard([&]() noexcept { execution_count++; });
        ScopeGuard guard2(std::move(guard1));
        EXPECT_FALSE(static_cast<bool>(guard1));
        EXPECT_TRUE(static_cast<bool>(guard2));
    }
    ASSERT_EQ(execution_count.load(), 1);
}

TEST(ScopeGuardTest, NoexceptCorrectness)
{
    auto nf = []() noexcept {};
    using GuardType = decltype(make_scope_guard(nf));
    static_assert(std::is_nothrow_move_constructible_v<GuardType>,
                  "ScopeGuard with noexcept lambda should be nothrow move constructible.");
    static_assert(!std::is_copy_constructible_v<GuardType>, "ScopeGuard must not be copyable.");
    SUCCEED();
}
