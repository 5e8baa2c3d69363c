#pragma once

#include "../ports/IRetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace iotpipe::adapters {

/// Delay for attempt n is baseDelay * multiplier^(n-1), capped at maxDelay
class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                  double multiplier = 2.0,
                                  std::chrono::milliseconds maxDelay = std::chrono::minutes(5),
                                  int maxAttempts = 5)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        const double scaled = baseDelay_.count() * std::pow(multiplier_, std::max(attemptCount, 1) - 1);
        if (scaled >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(scaled));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

/// Never retries; used when retries are disabled in configuration
class NoRetryPolicy : public ports::RetryPolicy {
public:
    std::chrono::milliseconds getBackoffDelay(int) const override { return std::chrono::milliseconds(0); }
    bool shouldRetry(int) const override { return false; }
};

} // namespace iotpipe::adapters
