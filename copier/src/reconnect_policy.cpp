#include "reconnect_policy.hpp"
#include <algorithm>

ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds base_delay, int cap_factor, int max_attempts)
    : base_delay_(base_delay),
      cap_factor_(std::max(1, cap_factor)),
      max_attempts_(std::max(1, max_attempts)) {
}

int ReconnectPolicy::record_failure() {
    return attempts_.fetch_add(1) + 1;
}

void ReconnectPolicy::record_success() {
    attempts_.store(0);
}

std::chrono::milliseconds ReconnectPolicy::delay_for(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }
    return base_delay_ * std::min(attempt, cap_factor_);
}

bool ReconnectPolicy::should_retry(int attempt) const {
    return attempt < max_attempts_;
}
