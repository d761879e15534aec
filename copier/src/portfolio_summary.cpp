#include "portfolio_summary.hpp"
#include <algorithm>

PortfolioSummary summarize_positions(const std::vector<Position>& positions, size_t top_n) {
    PortfolioSummary summary;
    summary.position_count = positions.size();

    double weighted_pnl = 0.0;
    for (const auto& pos : positions) {
        summary.total_value += pos.current_value;
        summary.initial_value += pos.initial_value;
        weighted_pnl += pos.current_value * pos.percent_pnl;
    }
    summary.weighted_pnl_percent = summary.total_value > 0.0 ? weighted_pnl / summary.total_value : 0.0;

    summary.top_positions = positions;
    std::stable_sort(summary.top_positions.begin(), summary.top_positions.end(),
                     [](const Position& a, const Position& b) { return a.percent_pnl > b.percent_pnl; });
    if (summary.top_positions.size() > top_n) {
        summary.top_positions.resize(top_n);
    }

    return summary;
}

double total_current_value(const std::vector<Position>& positions) {
    double total = 0.0;
    for (const auto& pos : positions) {
        total += pos.current_value;
    }
    return total;
}

const Position* find_position(const std::vector<Position>& positions, const std::string& condition_id) {
    auto it = std::find_if(positions.begin(), positions.end(),
                           [&](const Position& p) { return p.condition_id == condition_id; });
    return it == positions.end() ? nullptr : &*it;
}
