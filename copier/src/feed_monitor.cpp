#include "feed_monitor.hpp"
#include "trade_log.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

bool string_equals(const json& frame, const char* key, const char* expected) {
    auto it = frame.find(key);
    return it != frame.end() && it->is_string() && it->get<std::string>() == expected;
}

} // namespace

std::string to_string(MonitorState state) {
    switch (state) {
        case MonitorState::Disconnected: return "disconnected";
        case MonitorState::Connecting: return "connecting";
        case MonitorState::Subscribed: return "subscribed";
        case MonitorState::Streaming: return "streaming";
        case MonitorState::Closed: return "closed";
        case MonitorState::Errored: return "errored";
        case MonitorState::Stopped: return "stopped";
        case MonitorState::GaveUp: return "gave_up";
    }
    return "unknown";
}

FeedMonitor::FeedMonitor(const Config& config,
                         FeedTransportFactory transport_factory,
                         std::shared_ptr<TradeChannel> channel,
                         StopToken& stop)
    : config_(config),
      transport_factory_(std::move(transport_factory)),
      channel_(std::move(channel)),
      stop_(stop),
      reconnect_(std::chrono::milliseconds(config.reconnect_delay_ms),
                 config.reconnect_cap_factor,
                 config.max_reconnect_attempts) {
    for (const auto& address : config_.user_addresses) {
        tracked_.insert(util::to_lower(address));
    }
}

std::string FeedMonitor::build_subscribe_message(size_t tracked_count) {
    json subscriptions = json::array();
    for (size_t i = 0; i < tracked_count; ++i) {
        subscriptions.push_back({{"topic", "activity"}, {"type", "trades"}});
    }
    json message = {
        {"action", "subscribe"},
        {"subscriptions", subscriptions}
    };
    return message.dump();
}

std::optional<TradeSignal> FeedMonitor::handle_frame(const std::string& text) const {
    json frame = json::parse(text, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        return std::nullopt;
    }

    if (string_equals(frame, "action", "subscribed") || string_equals(frame, "status", "subscribed")) {
        spdlog::info("Feed subscription confirmed");
        return std::nullopt;
    }

    if (!string_equals(frame, "topic", "activity") || !string_equals(frame, "type", "trades")) {
        return std::nullopt;
    }

    auto payload = frame.find("payload");
    if (payload == frame.end()) {
        return std::nullopt;
    }

    TradeSignal signal;
    try {
        signal.event = TrackedEvent::from_json(*payload);
    } catch (const std::exception& e) {
        spdlog::debug("Dropping malformed activity payload: {}", e.what());
        return std::nullopt;
    }

    signal.source_address = util::to_lower(signal.event.proxy_wallet);
    if (tracked_.count(signal.source_address) == 0) {
        return std::nullopt;
    }
    return signal;
}

MonitorState FeedMonitor::run() {
    while (!stop_.stop_requested()) {
        run_connection();

        if (stop_.stop_requested()) {
            break;
        }

        int attempt = reconnect_.record_failure();
        if (!reconnect_.should_retry(attempt)) {
            set_state(MonitorState::GaveUp);
            spdlog::critical("Max feed reconnection attempts ({}) reached. Restart required.",
                             reconnect_.max_attempts());
            return MonitorState::GaveUp;
        }

        auto delay = reconnect_.delay_for(attempt);
        set_state(MonitorState::Disconnected);
        spdlog::info("Reconnecting to feed in {}ms (attempt {}/{})...",
                     delay.count(), attempt, reconnect_.max_attempts());
        if (!stop_.wait_for(delay)) {
            break;
        }
    }

    set_state(MonitorState::Stopped);
    spdlog::info("Feed monitor stopped after forwarding {} event(s)", events_forwarded_.load());
    return MonitorState::Stopped;
}

void FeedMonitor::run_connection() {
    set_state(MonitorState::Connecting);
    spdlog::info("Connecting to feed at {}...", config_.feed_ws_url);

    std::unique_ptr<FeedTransport> transport;
    try {
        transport = transport_factory_();
        transport->connect(config_.feed_ws_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to feed: {}", e.what());
        set_state(MonitorState::Errored);
        return;
    }

    try {
        transport->send_text(build_subscribe_message(tracked_.size()));
    } catch (const std::exception& e) {
        spdlog::error("Failed to send feed subscription: {}", e.what());
        set_state(MonitorState::Errored);
        transport->close();
        return;
    }

    set_state(MonitorState::Subscribed);
    reconnect_.record_success();
    spdlog::info("Subscribed to feed for {} trader(s), monitoring trades in real time", tracked_.size());

    set_state(MonitorState::Streaming);
    const auto read_timeout = std::chrono::milliseconds(config_.feed_read_timeout_ms);

    while (!stop_.stop_requested()) {
        ReadResult result;
        try {
            result = transport->read(read_timeout);
        } catch (const std::exception& e) {
            result.status = ReadStatus::Error;
            result.error = e.what();
        }

        switch (result.status) {
            case ReadStatus::Timeout:
                break;

            case ReadStatus::Message: {
                auto signal = handle_frame(result.text);
                if (!signal) {
                    break;
                }
                if (!channel_->push(std::move(*signal))) {
                    spdlog::warn("Trade channel closed, leaving feed");
                    transport->close();
                    return;
                }
                ++events_forwarded_;
                break;
            }

            case ReadStatus::Closed:
                spdlog::warn("Feed connection closed: {}", result.error);
                set_state(MonitorState::Closed);
                transport->close();
                return;

            case ReadStatus::Error:
                spdlog::error("Feed connection error: {}", result.error);
                set_state(MonitorState::Errored);
                transport->close();
                return;
        }
    }

    transport->close();
}

StartupSnapshot FeedMonitor::log_startup_snapshot(PositionSource& positions, BalanceSource& balances) const {
    StartupSnapshot snapshot;

    try {
        snapshot.balance = balances.fetch_balance(config_.proxy_wallet);
        auto mine = positions.fetch_positions(config_.proxy_wallet);
        if (mine) {
            snapshot.mine = summarize_positions(*mine, kMyTopPositions);
            trade_log::my_positions(config_.proxy_wallet, *snapshot.mine, snapshot.balance);
        } else {
            spdlog::error("Failed to fetch your positions");
        }

        for (const auto& address : config_.user_addresses) {
            auto theirs = positions.fetch_positions(address);
            snapshot.traders.push_back(theirs ? summarize_positions(*theirs, kTraderTopPositions)
                                              : PortfolioSummary{});
            trade_log::trader_positions(address, snapshot.traders.back());
        }
    } catch (const std::exception& e) {
        spdlog::error("Startup snapshot failed: {}", e.what());
    }

    return snapshot;
}

void FeedMonitor::set_state(MonitorState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("Feed monitor state: {} -> {}", to_string(previous), to_string(state));
    }
}
