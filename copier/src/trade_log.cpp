#include "trade_log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace trade_log {

void separator() {
    spdlog::info("{}", std::string(60, '-'));
}

void startup(const std::vector<std::string>& tracked, const std::string& controlled) {
    separator();
    spdlog::info("Copying {} trader(s) onto {}", tracked.size(), util::format_address(controlled));
    for (size_t i = 0; i < tracked.size(); ++i) {
        spdlog::info("  {}. {}", i + 1, util::format_address(tracked[i]));
    }
    separator();
}

void trade_detected(const std::string& source_address, const TrackedEvent& event) {
    spdlog::info("New trade by {}: {} {:.4f} @ {:.4f} (${:.2f})",
                 util::format_address(source_address), event.side_raw.empty() ? to_string(event.side) : event.side_raw,
                 event.size, event.price, event.notional());
    if (!event.title.empty()) {
        spdlog::info("  Market: {}{}", event.title, event.outcome.empty() ? "" : " [" + event.outcome + "]");
    }
    if (!event.event_slug.empty() || !event.slug.empty()) {
        spdlog::info("  Link: https://polymarket.com/event/{}", event.event_slug.empty() ? event.slug : event.event_slug);
    }
    spdlog::debug("  Asset: {} Tx: {}", event.asset, event.transaction_hash);
}

void balances(double my_balance, double trader_capital, const std::string& source_address) {
    spdlog::info("  Balances: mine ${:.2f} | {} ${:.2f}", my_balance, util::format_address(source_address), trader_capital);
}

void sizing(const SizingDecision& decision) {
    spdlog::info("  Sizing ({}): {}", to_string(decision.strategy), decision.reasoning);
    if (decision.below_minimum) {
        spdlog::warn("  Order raised to the minimum order size");
    }
}

void order_result(const OrderRequest& request, const OrderResult& result) {
    const char* unit = request.amount_kind == AmountKind::Usd ? "USD" : "shares";
    if (result.success) {
        spdlog::info("  Order placed: {} {:.4f} {} @ {:.4f}{}", to_string(request.side), request.amount, unit,
                     request.price, result.order_id.empty() ? "" : " (id " + result.order_id + ")");
    } else {
        spdlog::error("  Order failed: {} {:.4f} {} @ {:.4f}: {}", to_string(request.side), request.amount, unit,
                      request.price, result.message);
    }
}

namespace {

void top_positions(const PortfolioSummary& summary) {
    for (const auto& pos : summary.top_positions) {
        spdlog::info("    {:+.2f}% ${:.2f} {}{}", pos.percent_pnl, pos.current_value,
                     pos.title.empty() ? pos.condition_id : pos.title,
                     pos.outcome.empty() ? "" : " [" + pos.outcome + "]");
    }
}

} // namespace

void my_positions(const std::string& address, const PortfolioSummary& summary, std::optional<double> balance) {
    spdlog::info("Your account {}:", util::format_address(address));
    if (balance) {
        spdlog::info("  Balance: ${:.2f}", *balance);
    } else {
        spdlog::warn("  Balance: unavailable");
    }
    spdlog::info("  Open positions: {} | value ${:.2f} | invested ${:.2f} | P&L {:+.2f}%",
                 summary.position_count, summary.total_value, summary.initial_value, summary.weighted_pnl_percent);
    top_positions(summary);
}

void trader_positions(const std::string& address, const PortfolioSummary& summary) {
    spdlog::info("Trader {}: {} positions | value ${:.2f} | P&L {:+.2f}%", util::format_address(address),
                 summary.position_count, summary.total_value, summary.weighted_pnl_percent);
    top_positions(summary);
}

void health_line(const std::string& name, const std::string& status, const std::string& message) {
    if (status == "ok") {
        spdlog::info("  {:<16} {:<8} {}", name, status, message);
    } else if (status == "warning") {
        spdlog::warn("  {:<16} {:<8} {}", name, status, message);
    } else {
        spdlog::error("  {:<16} {:<8} {}", name, status, message);
    }
}

} // namespace trade_log
