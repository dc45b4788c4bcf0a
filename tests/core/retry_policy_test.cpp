// =============================================================================
// remio - Retry Policy Tests
// =============================================================================
// Unit tests for backoff, classification and cancellation of retried
// primitives.
// =============================================================================

#include "remio/core/retry_policy.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace remio::core {
namespace {

RetryOptions fastOptions(std::uint32_t attempts) {
    RetryOptions options;
    options.maxRetryTimes = attempts;
    options.initialDelay = std::chrono::milliseconds{0};
    options.maxDelay = std::chrono::milliseconds{0};
    return options;
}

// =============================================================================
// Backoff Curve Tests
// =============================================================================

TEST(RetryPolicyTest, DelayDoublesUntilCap) {
    RetryOptions options;
    options.initialDelay = std::chrono::milliseconds{100};
    options.maxDelay = std::chrono::milliseconds{1000};
    RetryPolicy policy(options);

    EXPECT_EQ(policy.delayFor(0).count(), 100);
    EXPECT_EQ(policy.delayFor(1).count(), 200);
    EXPECT_EQ(policy.delayFor(2).count(), 400);
    EXPECT_EQ(policy.delayFor(3).count(), 800);
    EXPECT_EQ(policy.delayFor(4).count(), 1000);
    EXPECT_EQ(policy.delayFor(60).count(), 1000);
}

TEST(RetryPolicyTest, ZeroAttemptsClampedToOne) {
    RetryPolicy policy(fastOptions(0));
    EXPECT_EQ(policy.options().maxRetryTimes, 1u);
}

// =============================================================================
// Execution Tests
// =============================================================================

TEST(RetryPolicyTest, SucceedsWithoutRetry) {
    RetryPolicy policy(fastOptions(3));
    int calls = 0;
    auto result = policy.run("fetch", [&]() -> Result<int> {
        ++calls;
        return 42;
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, RecoversFromTransientFailures) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;
    auto result = policy.run("fetch", [&]() -> Result<int> {
        if (++calls < 3) {
            return makeError(ErrorCode::kTimeout, "slow");
        }
        return calls;
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3);
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, FatalFailureIsNotRetried) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;
    auto result = policy.run("fetch", [&]() -> Result<int> {
        ++calls;
        return makeError(ErrorCode::kNotFound, "gone");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kNotFound);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, LogicalFailureIsNotRetried) {
    RetryPolicy policy(fastOptions(5));
    int calls = 0;
    auto result = policy.run("put", [&]() -> VoidResult {
        ++calls;
        return makeError(ErrorCode::kInvalidArgument, "bad part");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ExhaustionReportsLastFailure) {
    RetryPolicy policy(fastOptions(4));
    int calls = 0;
    auto result = policy.run("fetch block 2", [&]() -> Result<int> {
        ++calls;
        return makeError(ErrorCode::kServerError, "503");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kRetryExhausted);
    EXPECT_EQ(result.error().errorClass(), ErrorClass::kFatal);
    EXPECT_NE(result.error().message().find("503"), std::string::npos);
    EXPECT_NE(result.error().message().find("fetch block 2"), std::string::npos);
    EXPECT_EQ(calls, 4);
}

TEST(RetryPolicyTest, ExceptionsAreConverted) {
    RetryPolicy policy(fastOptions(3));
    int calls = 0;
    auto result = policy.run("put", [&]() -> Result<int> {
        if (++calls == 1) {
            throw IOError(ErrorCode::kConnectionReset, "reset by peer", ErrorContext{});
        }
        return 1;
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(calls, 2);
}

TEST(RetryPolicyTest, CustomClassifierControlsRetries) {
    RetryPolicy policy(fastOptions(3), [](const Error& error) {
        return error.code() == ErrorCode::kNotFound ? ErrorClass::kTransient
                                                    : ErrorClass::kFatal;
    });

    int calls = 0;
    auto result = policy.run("list", [&]() -> Result<int> {
        if (++calls < 2) {
            return makeError(ErrorCode::kNotFound, "eventually consistent");
        }
        return 0;
    });
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(calls, 2);

    calls = 0;
    auto timeout = policy.run("list", [&]() -> Result<int> {
        ++calls;
        return makeError(ErrorCode::kTimeout, "slow");
    });
    ASSERT_FALSE(timeout.has_value());
    EXPECT_EQ(timeout.error().code(), ErrorCode::kTimeout);
    EXPECT_EQ(calls, 1);
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST(RetryPolicyTest, CancelledBeforeFirstAttempt) {
    RetryPolicy policy(fastOptions(3));
    CancelToken cancel;
    cancel.cancel();

    int calls = 0;
    auto result = policy.run(
        "fetch",
        [&]() -> Result<int> {
            ++calls;
            return 0;
        },
        &cancel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_EQ(calls, 0);
}

TEST(RetryPolicyTest, CancelInterruptsBackoff) {
    RetryOptions options;
    options.maxRetryTimes = 5;
    options.initialDelay = std::chrono::milliseconds{10'000};
    options.maxDelay = std::chrono::milliseconds{60'000};
    RetryPolicy policy(options);

    CancelToken cancel;
    std::atomic<int> calls{0};
    std::thread canceller([&] {
        while (calls.load() == 0) {
            std::this_thread::yield();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = policy.run(
        "fetch",
        [&]() -> Result<int> {
            ++calls;
            return makeError(ErrorCode::kThrottled, "slow down");
        },
        &cancel);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_LT(elapsed, std::chrono::seconds{5});
}

TEST(CancelTokenTest, WaitTimesOutWhenNotCancelled) {
    CancelToken token;
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds{1}));
    EXPECT_FALSE(token.cancelled());
    token.cancel();
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds{10'000}));
}

}  // namespace
}  // namespace remio::core
