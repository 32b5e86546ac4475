#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace bk::util {

struct RetryPolicy {
    unsigned int maxAttempts = 10;
    std::chrono::milliseconds baseDelay{100};
    std::chrono::milliseconds maxDelay{2000};

    // Delay after the given failed attempt (1-based): min(base * 2^(attempt-1), max)
    [[nodiscard]] std::chrono::milliseconds delayAfter(const unsigned int attempt) const {
        auto delay = baseDelay;
        for (unsigned int i = 1; i < attempt && delay < maxDelay; ++i) delay *= 2;
        return std::min(delay, maxDelay);
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void sleepFor(const std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }

// Calls fn until it returns without throwing. After the final attempt the last
// exception propagates to the caller.
template <class Fn>
auto retryWithBackoff(Fn&& fn, const RetryPolicy& policy = {}, const Sleeper& sleep = sleepFor)
    -> std::invoke_result_t<Fn&> {
    if (policy.maxAttempts == 0) throw std::invalid_argument("retryWithBackoff: maxAttempts must be > 0");

    std::exception_ptr lastError;

    for (unsigned int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        try {
            return fn();
        } catch (...) {
            lastError = std::current_exception();
            if (attempt < policy.maxAttempts) sleep(policy.delayAfter(attempt));
        }
    }

    std::rethrow_exception(lastError);
}

}
