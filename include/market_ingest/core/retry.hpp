// include/market_ingest/core/retry.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <thread>
#include "market_ingest/core/error.hpp"
#include "market_ingest/core/logger.hpp"

namespace market_ingest {

/**
 * @brief Exponential backoff parameters
 */
struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds initial_delay{100};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{std::chrono::seconds(30)};
    std::chrono::milliseconds max_jitter{100};
};

namespace utils {

/**
 * @brief Delay before retry number `attempt` (1-based), jitter excluded
 */
inline std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt) {
    double delay = static_cast<double>(policy.initial_delay.count());
    for (int i = 1; i < attempt; ++i) {
        delay *= policy.multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            return policy.max_delay;
        }
    }
    return std::min(policy.max_delay,
                    std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay)));
}

/**
 * @brief Run func until it succeeds, fails with a code should_retry rejects,
 * or policy.max_attempts attempts are used
 * @param func Callable returning a Result
 * @param should_retry Predicate over the error code of a failed attempt
 * @param attempts_out Receives the number of attempts made, when not null
 */
template <typename Func>
auto retry_with_backoff(Func func, const RetryPolicy& policy,
                        const std::function<bool(ErrorCode)>& should_retry,
                        int* attempts_out = nullptr) -> decltype(func()) {
    thread_local std::mt19937 jitter_engine{std::random_device{}()};

    int attempt = 1;
    while (true) {
        auto result = func();
        if (attempts_out) {
            *attempts_out = attempt;
        }

        if (result.is_ok() || !should_retry(result.error()->code()) ||
            attempt >= policy.max_attempts) {
            return result;
        }

        auto delay = backoff_delay(policy, attempt);
        if (policy.max_jitter.count() > 0) {
            std::uniform_int_distribution<long> jitter(0, policy.max_jitter.count());
            delay += std::chrono::milliseconds(jitter(jitter_engine));
        }

        WARN("Attempt " << attempt << " of " << policy.max_attempts
                        << " failed, retrying in " << delay.count()
                        << "ms: " << result.error()->what());

        std::this_thread::sleep_for(delay);
        ++attempt;
    }
}

/**
 * @brief Retry only transient store failures
 */
template <typename Func>
auto retry_database_operation(Func func, int max_attempts = 3) -> decltype(func()) {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    return retry_with_backoff(func, policy,
                              [](ErrorCode code) { return code == ErrorCode::DATABASE_ERROR; });
}

}  // namespace utils
}  // namespace market_ingest
