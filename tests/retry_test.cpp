#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include "infra/retry.hpp"

using namespace std::chrono_literals;
using extsort::infra::ErrorCode;
using extsort::infra::RetryPolicy;
using extsort::infra::VoidResult;
using extsort::infra::make_error;
using extsort::infra::with_retry;

TEST(RetryPolicyTest, DelayGrowsExponentially)
{
    RetryPolicy policy{.max_retries = 4, .base_delay = 100ms};
    EXPECT_EQ(policy.delay_for(0), 100ms);
    EXPECT_EQ(policy.delay_for(1), 200ms);
    EXPECT_EQ(policy.delay_for(2), 400ms);
    EXPECT_EQ(policy.delay_for(3), 800ms);
}

TEST(RetryPolicyTest, DelayIsCapped)
{
    RetryPolicy policy{.max_retries = 100, .base_delay = 1000ms};
    EXPECT_EQ(policy.delay_for(80), std::chrono::milliseconds(3'600'000));
}

TEST(RetryPolicyTest, SuccessNeedsNoRetry)
{
    int calls = 0;
    auto attempt = with_retry([&]() -> VoidResult { ++calls; return {}; },
                              RetryPolicy{.max_retries = 3, .base_delay = 1ms});
    EXPECT_TRUE(attempt.result.has_value());
    EXPECT_EQ(attempt.retries, 0);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, TransientErrorIsRetriedUntilSuccess)
{
    int calls = 0;
    auto attempt = with_retry([&]() -> VoidResult {
        if (++calls < 3) return std::unexpected(make_error(ErrorCode::TransientIO, "EAGAIN"));
        return {};
    }, RetryPolicy{.max_retries = 5, .base_delay = 1ms});

    EXPECT_TRUE(attempt.result.has_value());
    EXPECT_EQ(attempt.retries, 2);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, LockedErrorExhaustsRetries)
{
    int calls = 0;
    auto attempt = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::FileLocked, "locked"));
    }, RetryPolicy{.max_retries = 3, .base_delay = 1ms});

    ASSERT_FALSE(attempt.result.has_value());
    EXPECT_EQ(attempt.result.error().code, ErrorCode::FileLocked);
    EXPECT_EQ(attempt.retries, 3);
    EXPECT_EQ(calls, 4);
    EXPECT_FALSE(attempt.cancelled);
}

TEST(RetryPolicyTest, FatalErrorIsNotRetried)
{
    int calls = 0;
    auto attempt = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::DiskFull, "ENOSPC"));
    }, RetryPolicy{.max_retries = 5, .base_delay = 1ms});

    ASSERT_FALSE(attempt.result.has_value());
    EXPECT_EQ(attempt.retries, 0);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ZeroRetriesMeansSingleAttempt)
{
    int calls = 0;
    auto attempt = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::Busy, "EBUSY"));
    }, RetryPolicy{.max_retries = 0, .base_delay = 1ms});

    EXPECT_FALSE(attempt.result.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, StopInterruptsBackoff)
{
    std::stop_source stop;
    std::jthread canceller([&] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    auto attempt = with_retry([&]() -> VoidResult {
        return std::unexpected(make_error(ErrorCode::FileLocked, "locked"));
    }, RetryPolicy{.max_retries = 3, .base_delay = 10s}, stop.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(attempt.cancelled);
    EXPECT_FALSE(attempt.result.has_value());
    EXPECT_LT(elapsed, 5s);
}

TEST(RetryPolicyTest, InterruptibleSleepWithoutStop)
{
    EXPECT_TRUE(extsort::infra::interruptible_sleep(1ms, {}));

    std::stop_source stop;
    stop.request_stop();
    EXPECT_FALSE(extsort::infra::interruptible_sleep(1s, stop.get_token()));
}
