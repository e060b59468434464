#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace meshdest::resilience {

struct RetryOptions {
    // Consecutive failed attempts tolerated before giving up (>= 1).
    int max_attempts = 8;
    std::chrono::milliseconds base_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
    double jitter_ratio = 0.2; // [0,1]
};

class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions opts = {});

    int max_attempts() const { return opts_.max_attempts; }
    const RetryOptions& options() const { return opts_; }

    // attempt: 1..max_attempts, returns sleep duration before the attempt (attempt=1 returns 0)
    std::chrono::milliseconds BackoffBeforeAttempt(int attempt) const;

private:
    RetryOptions opts_;
};

// Tracks consecutive failures of a long-lived operation, such as an upstream
// watch that has to be re-opened after a disconnect. Not thread-safe.
class Backoff {
public:
    explicit Backoff(RetryPolicy policy) : policy_(policy) {}

    // Records a failed attempt. Returns the delay before the next attempt, or
    // nullopt once max_attempts consecutive attempts have failed.
    std::optional<std::chrono::milliseconds> OnFailure();

    // A successful attempt clears the failure streak.
    void Reset() { failures_ = 0; }

    int failures() const { return failures_; }

private:
    RetryPolicy policy_;
    int failures_ = 0;
};

} // namespace meshdest::resilience
