// Task-level retry policy applied by the scheduler after a failed attempt.
#pragma once
#include "scpflow/TransferError.hpp"

#include <chrono>
#include <string>

namespace scpflow {

struct RetryPolicy {
    bool enabled = true;
    int maxRetries = 3;
    std::chrono::milliseconds baseDelay{2000};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{60000};
    // Digest mismatches fail the task unless this is set.
    bool retryVerificationMismatch = false;

    // Delay before the attempt that follows failure number `retryCount`
    // (1-based): baseDelay * multiplier^(retryCount-1), capped at maxDelay.
    std::chrono::milliseconds delayFor(int retryCount) const;

    // Whether a task whose retryCount has just been incremented to
    // `retryCount` goes back to pending.
    bool shouldRetry(int retryCount, int taskMaxRetries, ErrorKind kind) const;

    bool validate(std::string& err) const;
};

} // namespace scpflow
