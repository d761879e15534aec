#include "trade_executor.hpp"
#include "audit_logger.hpp"
#include "portfolio_summary.hpp"
#include "trade_log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {

constexpr auto kChannelPollInterval = std::chrono::milliseconds(250);
constexpr double kMillisPerHour = 1000.0 * 3600.0;

} // namespace

std::string to_string(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::Stale: return "stale";
        case ExecutionOutcome::MissingTxHash: return "missing_tx_hash";
        case ExecutionOutcome::Duplicate: return "duplicate";
        case ExecutionOutcome::PositionLookupFailed: return "position_lookup_failed";
        case ExecutionOutcome::NothingToSell: return "nothing_to_sell";
        case ExecutionOutcome::ZeroAmount: return "zero_amount";
        case ExecutionOutcome::Submitted: return "submitted";
        case ExecutionOutcome::Failed: return "failed";
    }
    return "unknown";
}

TradeExecutor::TradeExecutor(const Config& config,
                             std::shared_ptr<DedupLedger> ledger,
                             std::shared_ptr<Signer> signer,
                             std::shared_ptr<PositionSource> positions,
                             std::shared_ptr<BalanceSource> balances,
                             std::shared_ptr<AuditLogger> audit)
    : config_(config),
      policy_(config.sizing),
      ledger_(std::move(ledger)),
      signer_(std::move(signer)),
      positions_(std::move(positions)),
      balances_(std::move(balances)),
      audit_(std::move(audit)) {
    if (!ledger_ || !signer_ || !positions_ || !balances_) {
        throw std::invalid_argument("TradeExecutor requires a ledger, signer, position source and balance source");
    }
}

ExecutionOutcome TradeExecutor::on_event(const TrackedEvent& event, const std::string& source_address) {
    int64_t event_ms = util::normalize_epoch_millis(event.timestamp);
    double hours_ago = static_cast<double>(util::now_millis() - event_ms) / kMillisPerHour;
    if (hours_ago > config_.too_old_timestamp_hours) {
        spdlog::debug("Skipping stale trade {} ({:.1f}h old)", event.transaction_hash, hours_ago);
        return skip(ExecutionOutcome::Stale);
    }

    if (event.transaction_hash.empty()) {
        spdlog::debug("Skipping trade without transaction hash from {}", util::format_address(source_address));
        return skip(ExecutionOutcome::MissingTxHash);
    }

    if (ledger_->check_and_insert(source_address, event.transaction_hash)) {
        spdlog::debug("Skipping already processed trade {}", event.transaction_hash);
        return skip(ExecutionOutcome::Duplicate);
    }

    trade_log::trade_detected(source_address, event);

    auto my_positions = positions_->fetch_positions(config_.proxy_wallet);
    if (!my_positions) {
        spdlog::error("Abandoning trade {}: could not fetch your positions", event.transaction_hash);
        ++failed_;
        return ExecutionOutcome::PositionLookupFailed;
    }
    auto user_positions = positions_->fetch_positions(source_address);
    if (!user_positions) {
        spdlog::error("Abandoning trade {}: could not fetch positions of {}",
                      event.transaction_hash, util::format_address(source_address));
        ++failed_;
        return ExecutionOutcome::PositionLookupFailed;
    }

    const Position* my_position = find_position(*my_positions, event.condition_id);
    const Position* user_position = find_position(*user_positions, event.condition_id);

    auto balance = balances_->fetch_balance(config_.proxy_wallet);
    if (!balance) {
        spdlog::warn("Balance lookup failed, sizing against $0");
    }
    double my_balance = balance.value_or(0.0);
    double user_capital = total_current_value(*user_positions);

    trade_log::balances(my_balance, user_capital, source_address);
    if (user_position) {
        spdlog::debug("  Trader position in market: {:.4f} shares (${:.2f})",
                      user_position->size, user_position->current_value);
    }

    auto decision = policy_.compute_order(event.notional(), my_balance,
                                          my_position ? my_position->current_value : 0.0);
    trade_log::sizing(decision);

    OrderRequest request;
    request.side = event.side;
    request.token_id = event.asset;
    request.condition_id = event.condition_id;
    request.price = event.price;
    request.source_address = source_address;
    request.source_tx_hash = event.transaction_hash;

    if (event.side == Side::Buy) {
        request.amount_kind = AmountKind::Usd;
        request.amount = decision.final_amount;
    } else {
        if (!my_position || my_position->size <= 0.0) {
            spdlog::info("  No position in this market, nothing to sell");
            return skip(ExecutionOutcome::NothingToSell);
        }
        double shares = event.price > 0.0 ? decision.final_amount / event.price : my_position->size;
        request.amount_kind = AmountKind::Shares;
        request.amount = std::min(shares, my_position->size);
    }

    if (request.amount <= 0.0) {
        spdlog::info("  Computed amount is zero, not submitting");
        return skip(ExecutionOutcome::ZeroAmount);
    }

    auto result = signer_->submit(request);
    trade_log::order_result(request, result);
    audit(source_address, event, decision, result);
    trade_log::separator();

    if (result.success) {
        ++submitted_;
        return ExecutionOutcome::Submitted;
    }
    ++failed_;
    return ExecutionOutcome::Failed;
}

void TradeExecutor::run_worker(TradeChannel& channel, StopToken& stop) {
    spdlog::info("Trade executor worker started");

    while (!stop.stop_requested()) {
        auto signal = channel.pop_for(kChannelPollInterval);
        if (!signal) {
            if (channel.is_closed()) {
                spdlog::warn("Trade channel closed");
                break;
            }
            continue;
        }

        try {
            on_event(signal->event, signal->source_address);
        } catch (const std::exception& e) {
            ++failed_;
            spdlog::error("Error executing trade: {}", e.what());
        }
    }

    spdlog::info("Trade executor worker stopped");
}

ExecutorStats TradeExecutor::stats() const {
    ExecutorStats s;
    s.submitted = submitted_.load();
    s.failed = failed_.load();
    s.skipped = skipped_.load();
    return s;
}

ExecutionOutcome TradeExecutor::skip(ExecutionOutcome outcome) {
    ++skipped_;
    return outcome;
}

void TradeExecutor::audit(const std::string& source_address, const TrackedEvent& event,
                          const SizingDecision& decision, const OrderResult& result) {
    if (!audit_) {
        return;
    }

    AuditRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.source_address = source_address;
    record.event = event;
    record.decision = decision;
    record.outcome = result.success ? "submitted" : "failed";
    record.details = result.success ? result.order_id : result.message;
    audit_->log_trade(record);
}
