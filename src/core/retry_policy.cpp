// =============================================================================
// remio - Retry Policy Implementation
// =============================================================================

#include "remio/core/retry_policy.h"

#include <algorithm>
#include <thread>

#include "remio/common/logger.h"

namespace remio::core {

// =============================================================================
// CancelToken Implementation
// =============================================================================

void CancelToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled(); });
}

// =============================================================================
// RetryPolicy Implementation
// =============================================================================

RetryPolicy::RetryPolicy(RetryOptions options, Classifier classifier)
    : options_(options)
    , classifier_(std::move(classifier)) {
    options_.maxRetryTimes = std::max<std::uint32_t>(options_.maxRetryTimes, 1);
}

std::chrono::milliseconds RetryPolicy::delayFor(std::uint32_t attempt) const noexcept {
    if (options_.initialDelay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    // Doubling past the cap is pointless and would overflow
    auto delay = options_.initialDelay;
    for (std::uint32_t i = 0; i < attempt && delay < options_.maxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.maxDelay);
}

ErrorClass RetryPolicy::classifyError(const Error& error) const {
    if (classifier_) {
        return classifier_(error);
    }
    return error.errorClass();
}

bool RetryPolicy::waitBeforeRetry(std::chrono::milliseconds delay, CancelToken* cancel) const {
    if (cancel != nullptr) {
        return cancel->waitFor(delay);
    }
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    return false;
}

void RetryPolicy::logRetry(std::string_view what, const Error& error, std::uint32_t attempt,
                           std::chrono::milliseconds delay) const {
    const std::string description = error.describe();
    const auto delayMs = static_cast<long long>(delay.count());
    if (attempt == 1) {
        REMIO_LOG_DEBUG("{}: {}, retry in {} ms after {} tries", what, description, delayMs,
                        attempt);
    } else if (attempt <= 3) {
        REMIO_LOG_INFO("{}: {}, retry in {} ms after {} tries", what, description, delayMs,
                       attempt);
    } else {
        REMIO_LOG_WARNING("{}: {}, retry in {} ms after {} tries", what, description, delayMs,
                          attempt);
    }
}

void RetryPolicy::logRecovered(std::string_view what, std::uint32_t retries) const {
    REMIO_LOG_INFO("{}: error already fixed by retry {} times", what, retries);
}

void RetryPolicy::logExhausted(std::string_view what, const Error& error,
                               std::uint32_t attempts) const {
    REMIO_LOG_ERROR("{}: giving up after {} attempts ({}): {}", what, attempts,
                    errorClassToString(classifyError(error)), error.describe());
}

}  // namespace remio::core
