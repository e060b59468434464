#include <meshdest/resilience/retry.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace meshdest::resilience {

namespace {

double JitterFactor(double ratio) {
    if (ratio <= 0.0) {
        return 1.0;
    }
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(-ratio, ratio);
    return 1.0 + dist(gen);
}

} // namespace

RetryPolicy::RetryPolicy(RetryOptions opts) : opts_(opts) {
    opts_.max_attempts = std::max(opts_.max_attempts, 1);
    opts_.jitter_ratio = std::clamp(opts_.jitter_ratio, 0.0, 1.0);
    if (opts_.base_backoff.count() < 0) {
        opts_.base_backoff = std::chrono::milliseconds(0);
    }
    if (opts_.max_backoff < opts_.base_backoff) {
        opts_.max_backoff = opts_.base_backoff;
    }
}

std::chrono::milliseconds RetryPolicy::BackoffBeforeAttempt(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds(0);
    }

    // base * 2^(attempt-2), capped before jitter so large attempts cannot overflow.
    const double factor = std::pow(2.0, static_cast<double>(std::min(attempt - 2, 30)));
    const double cap = static_cast<double>(opts_.max_backoff.count());
    const double raw = std::min(static_cast<double>(opts_.base_backoff.count()) * factor, cap);

    auto jittered = static_cast<long long>(raw * JitterFactor(opts_.jitter_ratio));
    jittered = std::clamp<long long>(jittered, 0, opts_.max_backoff.count());
    return std::chrono::milliseconds(jittered);
}

std::optional<std::chrono::milliseconds> Backoff::OnFailure() {
    ++failures_;
    if (failures_ >= policy_.max_attempts()) {
        return std::nullopt;
    }
    return policy_.BackoffBeforeAttempt(failures_ + 1);
}

} // namespace meshdest::resilience
