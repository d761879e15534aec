#include "test_macros.hpp"
#include "../copier/src/trade_executor.hpp"
#include "../copier/src/util.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

const std::string kTrader = "0x1111111111111111111111111111111111111111";
const std::string kMe = "0x9999999999999999999999999999999999999999";
const std::string kMarket = "0xmarket";

class FakePositions : public PositionSource {
public:
    std::map<std::string, std::vector<Position>> by_address;
    std::atomic<int> calls{0};

    std::optional<std::vector<Position>> fetch_positions(const std::string& address) override {
        ++calls;
        auto it = by_address.find(address);
        if (it == by_address.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

class FakeBalance : public BalanceSource {
public:
    std::optional<double> value = 1000.0;

    std::optional<double> fetch_balance(const std::string&) override { return value; }
};

class RecordingSubmitter : public OrderSubmitter {
public:
    bool succeed = true;
    bool throw_on_submit = false;
    std::vector<OrderRequest> requests;

    OrderResult submit(const OrderRequest& request) override {
        if (throw_on_submit) {
            throw std::runtime_error("relay unreachable");
        }
        requests.push_back(request);
        OrderResult result;
        result.success = succeed;
        result.order_id = succeed ? "order-" + std::to_string(requests.size()) : "";
        result.message = succeed ? "ok" : "rejected";
        return result;
    }
};

// Fails the run if two submissions are ever inside submit() at the same time
class OverlapDetectingSubmitter : public OrderSubmitter {
public:
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> calls{0};

    OrderResult submit(const OrderRequest&) override {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(5ms);
        ++calls;
        --in_flight;

        OrderResult result;
        result.success = true;
        result.order_id = "order";
        return result;
    }
};

Position make_position(const std::string& condition, double size, double current_value) {
    Position p;
    p.asset = "token-" + condition;
    p.condition_id = condition;
    p.size = size;
    p.current_value = current_value;
    p.initial_value = current_value;
    return p;
}

TrackedEvent make_event(Side side, double size, double price, const std::string& tx) {
    TrackedEvent event;
    event.timestamp = util::now_millis() / 1000;
    event.proxy_wallet = kTrader;
    event.condition_id = kMarket;
    event.asset = "token-" + kMarket;
    event.side = side;
    event.side_raw = to_string(side);
    event.size = size;
    event.price = price;
    event.transaction_hash = tx;
    return event;
}

struct Harness {
    Config config;
    std::shared_ptr<DedupLedger> ledger = std::make_shared<DedupLedger>();
    std::shared_ptr<RecordingSubmitter> submitter = std::make_shared<RecordingSubmitter>();
    std::shared_ptr<FakePositions> positions = std::make_shared<FakePositions>();
    std::shared_ptr<FakeBalance> balance = std::make_shared<FakeBalance>();
    std::unique_ptr<TradeExecutor> executor;

    Harness() {
        config.proxy_wallet = kMe;
        config.user_addresses = {kTrader};
        positions->by_address[kMe] = {};
        positions->by_address[kTrader] = {make_position(kMarket, 1000, 500)};
    }

    TradeExecutor& build() {
        auto signer = std::make_shared<Signer>(submitter, kMe, SignatureType::GnosisSafe);
        executor = std::make_unique<TradeExecutor>(config, ledger, signer, positions, balance);
        return *executor;
    }
};

} // namespace

TEST(test_buy_is_sized_in_usd) {
    Harness h;
    auto& executor = h.build();

    // Trader buys $100 notional; default 10% copy gives $10
    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx1"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::Submitted);
    ASSERT_EQ(h.submitter->requests.size(), 1u);
    const auto& request = h.submitter->requests[0];
    ASSERT_TRUE(request.side == Side::Buy);
    ASSERT_TRUE(request.amount_kind == AmountKind::Usd);
    ASSERT_NEAR(request.amount, 10.0, 1e-9);
    ASSERT_EQ(request.token_id, std::string("token-0xmarket"));
    ASSERT_EQ(request.funder_address, kMe);
    ASSERT_EQ(request.signature_type, 2);
    ASSERT_EQ(request.source_tx_hash, std::string("0xtx1"));
    ASSERT_EQ(executor.stats().submitted, 1u);
}

TEST(test_stale_event_skipped) {
    Harness h;
    auto& executor = h.build();

    auto event = make_event(Side::Buy, 200, 0.5, "0xold");
    event.timestamp -= 48 * 3600;

    ASSERT_TRUE(executor.on_event(event, kTrader) == ExecutionOutcome::Stale);
    ASSERT_TRUE(h.submitter->requests.empty());
    ASSERT_EQ(h.positions->calls.load(), 0);
    ASSERT_EQ(executor.stats().skipped, 1u);
}

TEST(test_millisecond_timestamp_accepted) {
    Harness h;
    auto& executor = h.build();

    auto event = make_event(Side::Buy, 200, 0.5, "0xms");
    event.timestamp = util::now_millis();

    ASSERT_TRUE(executor.on_event(event, kTrader) == ExecutionOutcome::Submitted);
}

TEST(test_missing_tx_hash_skipped) {
    Harness h;
    auto& executor = h.build();

    ASSERT_TRUE(executor.on_event(make_event(Side::Buy, 200, 0.5, ""), kTrader) == ExecutionOutcome::MissingTxHash);
    ASSERT_EQ(h.ledger->size(), 0u);
}

TEST(test_duplicate_skipped) {
    Harness h;
    auto& executor = h.build();

    auto event = make_event(Side::Buy, 200, 0.5, "0xdup");
    ASSERT_TRUE(executor.on_event(event, kTrader) == ExecutionOutcome::Submitted);
    ASSERT_TRUE(executor.on_event(event, kTrader) == ExecutionOutcome::Duplicate);
    ASSERT_EQ(h.submitter->requests.size(), 1u);

    auto stats = executor.stats();
    ASSERT_EQ(stats.submitted, 1u);
    ASSERT_EQ(stats.skipped, 1u);
}

TEST(test_position_lookup_failure_abandons_event) {
    Harness h;
    h.positions->by_address.erase(kTrader);
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::PositionLookupFailed);
    ASSERT_TRUE(h.submitter->requests.empty());
    ASSERT_EQ(executor.stats().failed, 1u);
}

TEST(test_balance_failure_sizes_against_zero) {
    Harness h;
    h.balance->value = std::nullopt;
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx"), kTrader);

    // Reduced to $0 by the balance rule, then raised to the $1 minimum
    ASSERT_TRUE(outcome == ExecutionOutcome::Submitted);
    ASSERT_NEAR(h.submitter->requests[0].amount, 1.0, 1e-9);
}

TEST(test_sell_without_position_dropped) {
    Harness h;
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Sell, 200, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::NothingToSell);
    ASSERT_TRUE(h.submitter->requests.empty());
    ASSERT_EQ(executor.stats().skipped, 1u);
}

TEST(test_sell_converts_to_shares) {
    Harness h;
    h.positions->by_address[kMe] = {make_position(kMarket, 50, 25)};
    auto& executor = h.build();

    // $50 notional -> $5 -> 10 shares at 0.5
    auto outcome = executor.on_event(make_event(Side::Sell, 100, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::Submitted);
    const auto& request = h.submitter->requests[0];
    ASSERT_TRUE(request.side == Side::Sell);
    ASSERT_TRUE(request.amount_kind == AmountKind::Shares);
    ASSERT_NEAR(request.amount, 10.0, 1e-9);
}

TEST(test_sell_capped_at_held_shares) {
    Harness h;
    h.positions->by_address[kMe] = {make_position(kMarket, 50, 25)};
    auto& executor = h.build();

    // $1000 notional -> $100 cap -> 200 shares, but only 50 are held
    executor.on_event(make_event(Side::Sell, 2000, 0.5, "0xtx"), kTrader);

    ASSERT_EQ(h.submitter->requests.size(), 1u);
    ASSERT_NEAR(h.submitter->requests[0].amount, 50.0, 1e-9);
}

TEST(test_zero_amount_not_submitted) {
    Harness h;
    h.config.sizing.min_order_size_usd = 0.0;
    h.config.sizing.max_position_size_usd = 10.0;
    h.positions->by_address[kMe] = {make_position(kMarket, 20, 10)};
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::ZeroAmount);
    ASSERT_TRUE(h.submitter->requests.empty());
}

TEST(test_rejected_order_counted_as_failed) {
    Harness h;
    h.submitter->succeed = false;
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::Failed);
    ASSERT_EQ(executor.stats().failed, 1u);
    ASSERT_EQ(executor.stats().submitted, 0u);
}

TEST(test_throwing_submitter_counted_as_failed) {
    Harness h;
    h.submitter->throw_on_submit = true;
    auto& executor = h.build();

    auto outcome = executor.on_event(make_event(Side::Buy, 200, 0.5, "0xtx"), kTrader);

    ASSERT_TRUE(outcome == ExecutionOutcome::Failed);
    ASSERT_EQ(executor.stats().failed, 1u);
}

TEST(test_null_dependencies_rejected) {
    Config config;
    auto ledger = std::make_shared<DedupLedger>();
    auto positions = std::make_shared<FakePositions>();
    auto balance = std::make_shared<FakeBalance>();

    ASSERT_THROWS(TradeExecutor(config, ledger, nullptr, positions, balance), std::invalid_argument);
    ASSERT_THROWS(Signer(nullptr, kMe, SignatureType::Eoa), std::invalid_argument);
}

TEST(test_workers_drain_channel) {
    Harness h;
    auto& executor = h.build();
    TradeChannel channel(16);
    StopToken stop;

    std::vector<std::thread> workers;
    for (int i = 0; i < 3; ++i) {
        workers.emplace_back([&]() { executor.run_worker(channel, stop); });
    }

    // Each hash is pushed twice; only one copy may reach the relay
    for (int i = 0; i < 10; ++i) {
        TradeSignal signal;
        signal.event = make_event(Side::Buy, 200, 0.5, "0xtx" + std::to_string(i));
        signal.source_address = kTrader;
        ASSERT_TRUE(channel.push(signal));
        ASSERT_TRUE(channel.push(signal));
    }
    channel.close();
    for (auto& worker : workers) {
        worker.join();
    }

    auto stats = executor.stats();
    ASSERT_EQ(stats.submitted, 10u);
    ASSERT_EQ(stats.skipped, 10u);
    ASSERT_EQ(h.submitter->requests.size(), 10u);
}

TEST(test_concurrent_workers_never_overlap_submissions) {
    Harness h;
    auto overlap = std::make_shared<OverlapDetectingSubmitter>();
    auto signer = std::make_shared<Signer>(overlap, kMe, SignatureType::GnosisSafe);
    TradeExecutor executor(h.config, h.ledger, signer, h.positions, h.balance);
    TradeChannel channel(64);
    StopToken stop;

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() { executor.run_worker(channel, stop); });
    }
    for (int i = 0; i < 24; ++i) {
        TradeSignal signal;
        signal.event = make_event(Side::Buy, 200, 0.5, "0xparallel" + std::to_string(i));
        signal.source_address = kTrader;
        ASSERT_TRUE(channel.push(signal));
    }
    channel.close();
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_EQ(overlap->calls.load(), 24);
    ASSERT_EQ(overlap->max_in_flight.load(), 1);
    ASSERT_EQ(executor.stats().submitted, 24u);
}

TEST(test_signer_serializes_direct_callers) {
    auto overlap = std::make_shared<OverlapDetectingSubmitter>();
    Signer signer(overlap, kMe, SignatureType::Eoa);

    std::vector<std::thread> callers;
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&]() {
            for (int j = 0; j < 3; ++j) {
                OrderRequest request;
                request.amount = 1.0;
                signer.submit(request);
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    ASSERT_EQ(overlap->calls.load(), 18);
    ASSERT_EQ(overlap->max_in_flight.load(), 1);
}

TEST(test_dry_run_submitter) {
    DryRunSubmitter submitter;
    OrderRequest request;
    request.amount = 5.0;

    auto result = submitter.submit(request);

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.order_id, std::string("dry-run-1"));
    ASSERT_EQ(submitter.submitted(), 1);
}

int main() {
    std::cout << "=== Trade Executor Tests ===\n";

    RUN_TEST(test_buy_is_sized_in_usd);
    RUN_TEST(test_stale_event_skipped);
    RUN_TEST(test_millisecond_timestamp_accepted);
    RUN_TEST(test_missing_tx_hash_skipped);
    RUN_TEST(test_duplicate_skipped);
    RUN_TEST(test_position_lookup_failure_abandons_event);
    RUN_TEST(test_balance_failure_sizes_against_zero);
    RUN_TEST(test_sell_without_position_dropped);
    RUN_TEST(test_sell_converts_to_shares);
    RUN_TEST(test_sell_capped_at_held_shares);
    RUN_TEST(test_zero_amount_not_submitted);
    RUN_TEST(test_rejected_order_counted_as_failed);
    RUN_TEST(test_throwing_submitter_counted_as_failed);
    RUN_TEST(test_null_dependencies_rejected);
    RUN_TEST(test_workers_drain_channel);
    RUN_TEST(test_concurrent_workers_never_overlap_submissions);
    RUN_TEST(test_signer_serializes_direct_callers);
    RUN_TEST(test_dry_run_submitter);

    return TEST_SUMMARY();
}
