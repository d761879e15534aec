#include "test_macros.hpp"
#include "../copier/src/portfolio_summary.hpp"

namespace {

Position make_position(const std::string& condition, double current_value, double initial_value, double pnl) {
    Position p;
    p.condition_id = condition;
    p.current_value = current_value;
    p.initial_value = initial_value;
    p.percent_pnl = pnl;
    return p;
}

} // namespace

TEST(test_empty_portfolio) {
    auto summary = summarize_positions({}, 5);

    ASSERT_EQ(summary.position_count, 0u);
    ASSERT_NEAR(summary.total_value, 0.0, 1e-12);
    ASSERT_NEAR(summary.weighted_pnl_percent, 0.0, 1e-12);
    ASSERT_TRUE(summary.top_positions.empty());
}

TEST(test_totals_and_weighted_pnl) {
    std::vector<Position> positions = {
        make_position("a", 100.0, 80.0, 25.0),
        make_position("b", 300.0, 400.0, -25.0)
    };

    auto summary = summarize_positions(positions, 5);

    ASSERT_EQ(summary.position_count, 2u);
    ASSERT_NEAR(summary.total_value, 400.0, 1e-9);
    ASSERT_NEAR(summary.initial_value, 480.0, 1e-9);
    // (100 * 25 + 300 * -25) / 400
    ASSERT_NEAR(summary.weighted_pnl_percent, -12.5, 1e-9);
}

TEST(test_top_positions_sorted_and_truncated) {
    std::vector<Position> positions = {
        make_position("low", 10.0, 10.0, -5.0),
        make_position("high", 10.0, 10.0, 50.0),
        make_position("mid", 10.0, 10.0, 10.0),
        make_position("mid2", 10.0, 10.0, 10.0)
    };

    auto summary = summarize_positions(positions, 3);

    ASSERT_EQ(summary.position_count, 4u);
    ASSERT_EQ(summary.top_positions.size(), 3u);
    ASSERT_EQ(summary.top_positions[0].condition_id, std::string("high"));
    ASSERT_EQ(summary.top_positions[1].condition_id, std::string("mid"));
    ASSERT_EQ(summary.top_positions[2].condition_id, std::string("mid2"));
}

TEST(test_total_current_value) {
    std::vector<Position> positions = {
        make_position("a", 12.5, 0.0, 0.0),
        make_position("b", 7.5, 0.0, 0.0)
    };
    ASSERT_NEAR(total_current_value(positions), 20.0, 1e-12);
}

TEST(test_find_position) {
    std::vector<Position> positions = {
        make_position("a", 1.0, 1.0, 0.0),
        make_position("b", 2.0, 2.0, 0.0)
    };

    const Position* found = find_position(positions, "b");
    ASSERT_TRUE(found != nullptr);
    ASSERT_NEAR(found->current_value, 2.0, 1e-12);
    ASSERT_TRUE(find_position(positions, "c") == nullptr);
}

int main() {
    std::cout << "=== Portfolio Summary Tests ===\n";

    RUN_TEST(test_empty_portfolio);
    RUN_TEST(test_totals_and_weighted_pnl);
    RUN_TEST(test_top_positions_sorted_and_truncated);
    RUN_TEST(test_total_current_value);
    RUN_TEST(test_find_position);

    return TEST_SUMMARY();
}
