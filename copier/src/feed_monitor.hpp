#pragma once
#include "bounded_channel.hpp"
#include "chain_client.hpp"
#include "config.hpp"
#include "feed_transport.hpp"
#include "portfolio_summary.hpp"
#include "position_client.hpp"
#include "reconnect_policy.hpp"
#include "stop_token.hpp"
#include "types.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

enum class MonitorState {
    Disconnected,
    Connecting,
    Subscribed,
    Streaming,
    Closed,
    Errored,
    Stopped,
    GaveUp
};

std::string to_string(MonitorState state);

using TradeChannel = BoundedChannel<TradeSignal>;

struct StartupSnapshot {
    std::optional<double> balance;
    std::optional<PortfolioSummary> mine;
    std::vector<PortfolioSummary> traders; // same order as the tracked addresses
};

// Owns the feed subscription. Each connection attempt walks
// Disconnected -> Connecting -> Subscribed -> Streaming -> Closed/Errored and
// matched trades are pushed onto the channel. run() returns Stopped after a
// stop request or GaveUp once the reconnect budget is spent.
class FeedMonitor {
public:
    static constexpr size_t kMyTopPositions = 5;
    static constexpr size_t kTraderTopPositions = 3;

    FeedMonitor(const Config& config,
                FeedTransportFactory transport_factory,
                std::shared_ptr<TradeChannel> channel,
                StopToken& stop);

    MonitorState run();

    // Informational portfolio snapshot; never throws
    StartupSnapshot log_startup_snapshot(PositionSource& positions, BalanceSource& balances) const;

    // Classifies one inbound frame; returns the signal when it should be forwarded
    std::optional<TradeSignal> handle_frame(const std::string& text) const;

    static std::string build_subscribe_message(size_t tracked_count);

    MonitorState state() const { return state_.load(); }
    int reconnect_attempts() const { return reconnect_.attempts(); }
    uint64_t events_forwarded() const { return events_forwarded_.load(); }

    // Non-copyable
    FeedMonitor(const FeedMonitor&) = delete;
    FeedMonitor& operator=(const FeedMonitor&) = delete;

private:
    // One connect/subscribe/stream cycle; returns when the stream ends
    void run_connection();
    void set_state(MonitorState state);

    Config config_;
    FeedTransportFactory transport_factory_;
    std::shared_ptr<TradeChannel> channel_;
    StopToken& stop_;
    std::unordered_set<std::string> tracked_;

    ReconnectPolicy reconnect_;
    std::atomic<MonitorState> state_{MonitorState::Disconnected};
    std::atomic<uint64_t> events_forwarded_{0};
};
