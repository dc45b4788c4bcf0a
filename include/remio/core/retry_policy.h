// =============================================================================
// remio - Retry Policy
// =============================================================================
// Bounded exponential-backoff retry around a single network primitive.
//
// A primitive is any callable returning Result<T>. Failures are classified
// (Transient / Fatal / Logical); only Transient failures are retried. Attempt
// n (1-based) that fails transiently waits min(initialDelay * 2^n, maxDelay)
// before attempt n+1. After maxRetryTimes attempts the last failure is
// reported as kRetryExhausted, which is Fatal.
//
// Retried primitives must be idempotent: range fetches naturally are, part
// uploads are retried with the same part number and bytes.
//
// Waits are interruptible through a CancelToken so that closing a stream
// never waits out a long backoff.
// =============================================================================

#ifndef REMIO_CORE_RETRY_POLICY_H
#define REMIO_CORE_RETRY_POLICY_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "remio/common/config.h"
#include "remio/common/error.h"

namespace remio::core {

// =============================================================================
// Cancel Token
// =============================================================================

/// @brief One-shot cancellation flag with an interruptible wait.
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    /// @brief Request cancellation and wake every waiter.
    void cancel();

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// @brief Sleep for @p duration unless cancelled first.
    /// @return true if the token was cancelled.
    bool waitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

// =============================================================================
// Retry Policy
// =============================================================================

class RetryPolicy {
public:
    /// @brief Maps a failure to its class. Empty means remio::classify(code).
    using Classifier = std::function<ErrorClass(const Error&)>;

    explicit RetryPolicy(RetryOptions options = {}, Classifier classifier = {});

    /// @brief Backoff before the attempt following failed attempt @p attempt.
    [[nodiscard]] std::chrono::milliseconds delayFor(std::uint32_t attempt) const noexcept;

    [[nodiscard]] const RetryOptions& options() const noexcept { return options_; }

    /// @brief Run @p operation until success, a non-transient failure, retry
    ///        exhaustion or cancellation.
    /// @param what Short description used in log lines and error messages.
    /// @param operation Callable returning Result<T>; exceptions are converted.
    /// @param cancel Optional token interrupting backoff waits.
    template <typename F>
    [[nodiscard]] std::invoke_result_t<F&> run(std::string_view what, F&& operation,
                                               CancelToken* cancel = nullptr) const {
        using ResultType = std::invoke_result_t<F&>;

        for (std::uint32_t attempt = 1;; ++attempt) {
            if (cancel != nullptr && cancel->cancelled()) {
                return ResultType{makeError(ErrorCode::kCancelled,
                                            fmt::format("{} cancelled", what))};
            }

            ResultType result = tryExecute(operation);
            if (result.has_value()) {
                if (attempt > 1) {
                    logRecovered(what, attempt - 1);
                }
                return result;
            }

            const Error& error = result.error();
            if (classifyError(error) != ErrorClass::kTransient) {
                return result;
            }

            if (attempt >= options_.maxRetryTimes) {
                logExhausted(what, error, attempt);
                return ResultType{makeError(
                    ErrorCode::kRetryExhausted,
                    fmt::format("{} failed after {} attempts: {}", what, attempt,
                                error.describe()))};
            }

            const auto delay = delayFor(attempt);
            logRetry(what, error, attempt, delay);
            if (waitBeforeRetry(delay, cancel)) {
                return ResultType{makeError(ErrorCode::kCancelled,
                                            fmt::format("{} cancelled during backoff", what))};
            }
        }
    }

private:
    [[nodiscard]] ErrorClass classifyError(const Error& error) const;

    /// @return true if cancelled while waiting.
    bool waitBeforeRetry(std::chrono::milliseconds delay, CancelToken* cancel) const;

    void logRetry(std::string_view what, const Error& error, std::uint32_t attempt,
                  std::chrono::milliseconds delay) const;
    void logRecovered(std::string_view what, std::uint32_t retries) const;
    void logExhausted(std::string_view what, const Error& error, std::uint32_t attempts) const;

    RetryOptions options_;
    Classifier classifier_;
};

}  // namespace remio::core

#endif  // REMIO_CORE_RETRY_POLICY_H
