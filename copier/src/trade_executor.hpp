#pragma once
#include "chain_client.hpp"
#include "config.hpp"
#include "dedup_ledger.hpp"
#include "feed_monitor.hpp"
#include "order_submitter.hpp"
#include "position_client.hpp"
#include "sizing_policy.hpp"
#include "stop_token.hpp"
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

class AuditLogger;

enum class ExecutionOutcome {
    Stale,
    MissingTxHash,
    Duplicate,
    PositionLookupFailed,
    NothingToSell,
    ZeroAmount,
    Submitted,
    Failed
};

std::string to_string(ExecutionOutcome outcome);

struct ExecutorStats {
    uint64_t submitted = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
};

// Turns matched feed events into orders. Any number of workers may call
// on_event concurrently; the dedup ledger and the signer serialize the effects.
class TradeExecutor {
public:
    TradeExecutor(const Config& config,
                  std::shared_ptr<DedupLedger> ledger,
                  std::shared_ptr<Signer> signer,
                  std::shared_ptr<PositionSource> positions,
                  std::shared_ptr<BalanceSource> balances,
                  std::shared_ptr<AuditLogger> audit = nullptr);

    ExecutionOutcome on_event(const TrackedEvent& event, const std::string& source_address);

    // Worker loop: drains the channel until it is closed or a stop is requested
    void run_worker(TradeChannel& channel, StopToken& stop);

    ExecutorStats stats() const;

    // Non-copyable
    TradeExecutor(const TradeExecutor&) = delete;
    TradeExecutor& operator=(const TradeExecutor&) = delete;

private:
    ExecutionOutcome skip(ExecutionOutcome outcome);
    void audit(const std::string& source_address, const TrackedEvent& event,
               const SizingDecision& decision, const OrderResult& result);

    Config config_;
    SizingPolicy policy_;
    std::shared_ptr<DedupLedger> ledger_;
    std::shared_ptr<Signer> signer_;
    std::shared_ptr<PositionSource> positions_;
    std::shared_ptr<BalanceSource> balances_;
    std::shared_ptr<AuditLogger> audit_;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> skipped_{0};
};
