/**
 * @file retry_tests.cpp
 * @brief Bounded polling and best-effort execution
 *
 * @date 2025
 */

#include "fake_services.hpp"

#include "stratus/core/best_effort.hpp"
#include "stratus/core/retry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace stratus::core;

TEST(PollUntilTest, StopsAtFirstSuccess) {
    auto pauses = std::make_shared<std::vector<std::chrono::milliseconds>>();
    RetryPolicy policy{5, std::chrono::milliseconds(100), std::nullopt};

    int calls = 0;
    auto result = PollUntil(policy, stratus::fakes::RecordingSleeper(pauses), [&] {
        return ++calls == 3;
    });

    EXPECT_TRUE(result.satisfied);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(pauses->size(), 2u);
}

TEST(PollUntilTest, NeverSleepsAfterLastAttempt) {
    auto pauses = std::make_shared<std::vector<std::chrono::milliseconds>>();
    RetryPolicy policy{4, std::chrono::milliseconds(30000), std::nullopt};

    auto result = PollUntil(policy, stratus::fakes::RecordingSleeper(pauses), [] { return false; });

    EXPECT_FALSE(result.satisfied);
    EXPECT_EQ(result.attempts, 4);
    ASSERT_EQ(pauses->size(), 3u);
    for (auto pause : *pauses) {
        EXPECT_EQ(pause, std::chrono::milliseconds(30000));
    }
}

TEST(PollUntilTest, ExpiredDeadlineStopsEarly) {
    RetryPolicy policy{100, std::chrono::milliseconds(1), std::chrono::milliseconds(0)};

    int calls = 0;
    auto result = PollUntil(policy, stratus::fakes::NoSleep(), [&] {
        ++calls;
        return false;
    });

    EXPECT_FALSE(result.satisfied);
    EXPECT_EQ(calls, 1);
}

TEST(PollUntilTest, ZeroAttemptsStillProbesOnce) {
    RetryPolicy policy{0, std::chrono::milliseconds(1), std::nullopt};
    auto result = PollUntil(policy, stratus::fakes::NoSleep(), [] { return true; });
    EXPECT_TRUE(result.satisfied);
    EXPECT_EQ(result.attempts, 1);
}

TEST(PollUntilTest, ProbeExceptionsPropagate) {
    RetryPolicy policy{3, std::chrono::milliseconds(1), std::nullopt};
    EXPECT_THROW(PollUntil(policy, stratus::fakes::NoSleep(), []() -> bool {
        throw std::runtime_error("probe failed");
    }), std::runtime_error);
}

TEST(BestEffortTest, AbsorbsExceptions) {
    bool ran = false;
    EXPECT_TRUE(BestEffort("do nothing", [&] { ran = true; }));
    EXPECT_TRUE(ran);

    EXPECT_FALSE(BestEffort("fail", [] { throw std::runtime_error("boom"); }));
}
