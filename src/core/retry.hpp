#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <fmt/format.h>
#include "log.hpp"

// Shared retry-with-backoff used by transfers, remote commands and the
// archive source. attempt_fn(attempt) returns a result with is_ok() and
// an `error` string; is_retryable(result) decides whether another attempt
// is worthwhile.

enum class Backoff { LINEAR, EXPONENTIAL };

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{2000};
    Backoff backoff = Backoff::LINEAR;

    // attempt is 1-based: the delay after the first failure is base_delay
    std::chrono::milliseconds delay_for(int attempt) const {
        if (backoff == Backoff::EXPONENTIAL) {
            return base_delay * (1LL << (attempt - 1));
        }
        return base_delay * attempt;
    }
};

template <typename AttemptFn, typename RetryablePred>
auto retry_with_backoff(const RetryPolicy& policy, const std::string& label,
                        AttemptFn&& attempt_fn, RetryablePred&& is_retryable)
    -> decltype(attempt_fn(1)) {
    int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1;; ++attempt) {
        auto result = attempt_fn(attempt);
        if (result.is_ok()) return result;

        if (!is_retryable(result) || attempt >= attempts) {
            ferry_log(fmt::format("[retry] {} giving up after {} attempt(s): {}",
                                  label, attempt, result.error));
            return result;
        }

        auto delay = policy.delay_for(attempt);
        ferry_log(fmt::format("[retry] {} attempt {}/{} failed: {} (next in {}ms)",
                              label, attempt, attempts, result.error, delay.count()));
        std::this_thread::sleep_for(delay);
    }
}

template <typename AttemptFn>
auto retry_with_backoff(const RetryPolicy& policy, const std::string& label,
                        AttemptFn&& attempt_fn) -> decltype(attempt_fn(1)) {
    return retry_with_backoff(policy, label, std::forward<AttemptFn>(attempt_fn),
                              [](const auto&) { return true; });
}
