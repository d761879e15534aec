#pragma once
#include <atomic>
#include <chrono>

// Linear backoff for the feed connection: attempt n waits base * min(n, cap_factor).
// The counter resets on every successful subscribe; reaching max_attempts
// consecutive failures means giving up.
class ReconnectPolicy {
public:
    ReconnectPolicy(std::chrono::milliseconds base_delay, int cap_factor = 5, int max_attempts = 10);

    // Record a failed connection cycle, returns the new attempt number
    int record_failure();

    // Record a successful subscribe (resets the counter)
    void record_success();

    // Delay before retrying after the given attempt
    std::chrono::milliseconds delay_for(int attempt) const;

    // False once the attempt number reaches the configured maximum
    bool should_retry(int attempt) const;

    int attempts() const { return attempts_.load(); }
    int max_attempts() const { return max_attempts_; }

private:
    std::chrono::milliseconds base_delay_;
    int cap_factor_;
    int max_attempts_;
    std::atomic<int> attempts_{0};
};
