#pragma once

#include <orderpix/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <thread>
#include <utility>

namespace orderpix::downloader {

using RetryablePredicate = std::function<bool(const Error&)>;

/**
 * Retry/backoff policy shared by the page fetcher and the download scheduler.
 *
 * Attempt n (1-based) that fails with a retryable error is followed by a sleep of
 * min(initialBackoff * multiplier^(n-1), maxBackoff) before attempt n+1. At most
 * maxAttempts attempts are made in total.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
    RetryablePredicate retryable{}; // empty = isTransient

    [[nodiscard]] bool shouldRetry(const Error& error) const {
        return retryable ? retryable(error) : isTransient(error);
    }

    [[nodiscard]] std::chrono::milliseconds backoffAfter(int attempt) const {
        if (attempt < 1 || initialBackoff.count() <= 0)
            return std::chrono::milliseconds{0};
        const double scaled = static_cast<double>(initialBackoff.count()) *
                              std::pow(std::max(multiplier, 1.0), attempt - 1);
        const double capped = std::min(scaled, static_cast<double>(maxBackoff.count()));
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
    }
};

inline void sleepFor(const Sleeper& sleeper, std::chrono::milliseconds delay) {
    if (delay.count() <= 0)
        return;
    if (sleeper) {
        sleeper(delay);
    } else {
        std::this_thread::sleep_for(delay);
    }
}

/**
 * Run op(attempt) until it succeeds, fails with a non-retryable error, or the policy's
 * attempts are exhausted. attempts receives the number of calls made. onRetry(attempt, error,
 * delay) is invoked before each backoff sleep.
 */
template <typename T, typename Op, typename OnRetry>
Expected<T> retryWithBackoff(const RetryPolicy& policy, const Sleeper& sleeper, Op&& op,
                             OnRetry&& onRetry, int& attempts) {
    const int maxAttempts = std::max(policy.maxAttempts, 1);
    attempts = 0;
    for (;;) {
        ++attempts;
        Expected<T> result = op(attempts);
        if (result.ok())
            return result;
        if (attempts >= maxAttempts || !policy.shouldRetry(result.error()))
            return result;
        const auto delay = policy.backoffAfter(attempts);
        onRetry(attempts, result.error(), delay);
        sleepFor(sleeper, delay);
    }
}

} // namespace orderpix::downloader
