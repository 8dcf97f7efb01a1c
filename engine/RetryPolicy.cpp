#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace scpflow {

std::chrono::milliseconds RetryPolicy::delayFor(int retryCount) const {
    const int exponent = std::max(0, retryCount - 1);
    const double raw = static_cast<double>(baseDelay.count()) *
                       std::pow(multiplier, static_cast<double>(exponent));
    const double cap = static_cast<double>(maxDelay.count());
    if (!(raw < cap)) // also catches inf/nan
        return maxDelay;
    return std::chrono::milliseconds(static_cast<long long>(raw));
}

bool RetryPolicy::shouldRetry(int retryCount, int taskMaxRetries,
                              ErrorKind kind) const {
    if (!enabled)
        return false;
    if (kind == ErrorKind::Cancelled || kind == ErrorKind::InvalidArgument)
        return false;
    if (kind == ErrorKind::VerificationMismatch && !retryVerificationMismatch)
        return false;
    return retryCount < taskMaxRetries;
}

bool RetryPolicy::validate(std::string& err) const {
    if (maxRetries < 0) {
        err = "Max retries cannot be negative";
        return false;
    }
    if (baseDelay.count() < 0 || maxDelay.count() < 0) {
        err = "Retry delays cannot be negative";
        return false;
    }
    if (multiplier < 1.0) {
        err = "Backoff multiplier must be at least 1";
        return false;
    }
    return true;
}

} // namespace scpflow
