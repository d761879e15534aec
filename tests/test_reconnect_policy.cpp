#include "test_macros.hpp"
#include "../copier/src/reconnect_policy.hpp"

#include <chrono>

using std::chrono::milliseconds;

TEST(test_linear_backoff_capped) {
    ReconnectPolicy policy(milliseconds(5000));

    ASSERT_EQ(policy.delay_for(1).count(), 5000);
    ASSERT_EQ(policy.delay_for(2).count(), 10000);
    ASSERT_EQ(policy.delay_for(4).count(), 20000);
    ASSERT_EQ(policy.delay_for(5).count(), 25000);
    ASSERT_EQ(policy.delay_for(6).count(), 25000);
    ASSERT_EQ(policy.delay_for(9).count(), 25000);
}

TEST(test_custom_cap_factor) {
    ReconnectPolicy policy(milliseconds(100), 2, 10);

    ASSERT_EQ(policy.delay_for(1).count(), 100);
    ASSERT_EQ(policy.delay_for(2).count(), 200);
    ASSERT_EQ(policy.delay_for(3).count(), 200);
}

TEST(test_gives_up_at_max_attempts) {
    ReconnectPolicy policy(milliseconds(10), 5, 10);

    int retries = 0;
    while (true) {
        int attempt = policy.record_failure();
        if (!policy.should_retry(attempt)) {
            break;
        }
        ++retries;
    }

    ASSERT_EQ(retries, 9);
    ASSERT_EQ(policy.attempts(), 10);
}

TEST(test_success_resets_counter) {
    ReconnectPolicy policy(milliseconds(10), 5, 3);

    ASSERT_EQ(policy.record_failure(), 1);
    ASSERT_EQ(policy.record_failure(), 2);
    policy.record_success();
    ASSERT_EQ(policy.attempts(), 0);
    ASSERT_EQ(policy.record_failure(), 1);
    ASSERT_TRUE(policy.should_retry(1));
    ASSERT_TRUE(policy.should_retry(2));
    ASSERT_FALSE(policy.should_retry(3));
}

TEST(test_defaults) {
    ReconnectPolicy policy(milliseconds(5000));
    ASSERT_EQ(policy.max_attempts(), 10);
    ASSERT_EQ(policy.delay_for(0).count(), 0);
}

int main() {
    std::cout << "=== Reconnect Policy Tests ===\n";

    RUN_TEST(test_linear_backoff_capped);
    RUN_TEST(test_custom_cap_factor);
    RUN_TEST(test_gives_up_at_max_attempts);
    RUN_TEST(test_success_resets_counter);
    RUN_TEST(test_defaults);

    return TEST_SUMMARY();
}
