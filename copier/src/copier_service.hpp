#pragma once

#include "chain_client.hpp"
#include "config.hpp"
#include "dedup_ledger.hpp"
#include "feed_monitor.hpp"
#include "health.hpp"
#include "order_submitter.hpp"
#include "position_client.hpp"
#include "stop_token.hpp"
#include "trade_executor.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

class AuditLogger;

class CopierService {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitGaveUp = 2;

    explicit CopierService(const Config& config);
    ~CopierService();

    // Blocks until stop() is called or the feed monitor gives up.
    // Returns kExitOk or kExitGaveUp.
    int run();
    void stop();

    // Closes the channel, joins the monitor and workers, stops the health server
    // and logs the final counters. Only the first call does anything.
    void shutdown();

    nlohmann::json health_status() const;

private:
    std::shared_ptr<OrderSubmitter> make_submitter() const;
    void monitor_loop();

    Config config_;
    StopToken stop_;

    // Service components
    std::shared_ptr<ChainClient> chain_;
    std::shared_ptr<PositionClient> positions_;
    std::shared_ptr<AuditLogger> audit_;
    std::shared_ptr<DedupLedger> ledger_;
    std::shared_ptr<TradeChannel> channel_;
    std::shared_ptr<Signer> signer_;
    std::unique_ptr<FeedMonitor> monitor_;
    std::unique_ptr<TradeExecutor> executor_;
    std::unique_ptr<HealthServer> health_;

    // Thread management
    std::thread monitor_thread_;
    std::vector<std::thread> worker_threads_;
    std::atomic<bool> gave_up_{false};
    std::atomic<bool> shut_down_{false};
};
