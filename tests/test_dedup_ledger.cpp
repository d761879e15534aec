#include "test_macros.hpp"
#include "../copier/src/dedup_ledger.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

TEST(test_second_insert_is_duplicate) {
    DedupLedger ledger;

    ASSERT_FALSE(ledger.check_and_insert("0xabc", "0xtx1"));
    ASSERT_TRUE(ledger.check_and_insert("0xabc", "0xtx1"));
    ASSERT_EQ(ledger.size(), 1u);
}

TEST(test_key_includes_address) {
    DedupLedger ledger;

    ASSERT_FALSE(ledger.check_and_insert("0xaaa", "0xtx"));
    ASSERT_FALSE(ledger.check_and_insert("0xbbb", "0xtx"));
    ASSERT_EQ(DedupLedger::make_key("0xaaa", "0xtx"), std::string("0xaaa:0xtx"));
}

TEST(test_default_capacity) {
    DedupLedger ledger;
    ASSERT_EQ(ledger.capacity(), 1000u);
}

TEST(test_overflow_resets_to_triggering_key) {
    DedupLedger ledger(1000);

    for (int i = 0; i < 1000; ++i) {
        ASSERT_FALSE(ledger.check_and_insert("0xabc", "tx" + std::to_string(i)));
    }
    ASSERT_EQ(ledger.size(), 1000u);

    ASSERT_FALSE(ledger.check_and_insert("0xabc", "tx1000"));
    ASSERT_EQ(ledger.size(), 1u);

    // Only the triggering key survives the reset
    ASSERT_TRUE(ledger.check_and_insert("0xabc", "tx1000"));
    ASSERT_FALSE(ledger.check_and_insert("0xabc", "tx0"));
    ASSERT_EQ(ledger.size(), 2u);
}

TEST(test_small_capacity) {
    DedupLedger ledger(2);

    ASSERT_FALSE(ledger.check_and_insert("a", "1"));
    ASSERT_FALSE(ledger.check_and_insert("a", "2"));
    ASSERT_FALSE(ledger.check_and_insert("a", "3"));
    ASSERT_EQ(ledger.size(), 1u);
    ASSERT_TRUE(ledger.check_and_insert("a", "3"));
}

TEST(test_concurrent_insert_single_winner) {
    DedupLedger ledger;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                if (!ledger.check_and_insert("0xabc", "tx" + std::to_string(i))) {
                    ++winners;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    ASSERT_EQ(winners.load(), 100);
    ASSERT_EQ(ledger.size(), 100u);
}

int main() {
    std::cout << "=== Dedup Ledger Tests ===\n";

    RUN_TEST(test_second_insert_is_duplicate);
    RUN_TEST(test_key_includes_address);
    RUN_TEST(test_default_capacity);
    RUN_TEST(test_overflow_resets_to_triggering_key);
    RUN_TEST(test_small_capacity);
    RUN_TEST(test_concurrent_insert_single_winner);

    return TEST_SUMMARY();
}
