#pragma once
#include "portfolio_summary.hpp"
#include "sizing_policy.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Operator-facing log lines for the copy flow. Everything goes through spdlog.
namespace trade_log {

void separator();
void startup(const std::vector<std::string>& tracked, const std::string& controlled);

void trade_detected(const std::string& source_address, const TrackedEvent& event);
void balances(double my_balance, double trader_capital, const std::string& source_address);
void sizing(const SizingDecision& decision);
void order_result(const OrderRequest& request, const OrderResult& result);

void my_positions(const std::string& address, const PortfolioSummary& summary, std::optional<double> balance);
void trader_positions(const std::string& address, const PortfolioSummary& summary);

// status is "ok", "warning" or "error"
void health_line(const std::string& name, const std::string& status, const std::string& message);

} // namespace trade_log
