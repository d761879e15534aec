#pragma once
#include "types.hpp"
#include <cstddef>
#include <vector>

struct PortfolioSummary {
    size_t position_count = 0;
    double total_value = 0.0;
    double initial_value = 0.0;
    double weighted_pnl_percent = 0.0; // percent P&L weighted by current value
    std::vector<Position> top_positions; // best percent P&L first
};

PortfolioSummary summarize_positions(const std::vector<Position>& positions, size_t top_n);

// Sum of current values, used as the tracked account's capital proxy
double total_current_value(const std::vector<Position>& positions);

// First position whose condition id matches, if any
const Position* find_position(const std::vector<Position>& positions, const std::string& condition_id);
