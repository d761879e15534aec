
#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Side {
    Buy,
    Sell
};

std::string to_string(Side side);

// A trade observed on a tracked account, as pushed by the activity feed.
struct TrackedEvent {
    int64_t timestamp = 0; // seconds or milliseconds, as sent
    std::string proxy_wallet;
    std::string condition_id;
    std::string asset;
    Side side = Side::Buy;
    std::string side_raw;
    double size = 0.0;
    double price = 0.0;
    std::string transaction_hash;

    // Descriptive fields, only used in log lines and the audit trail
    std::string title;
    std::string slug;
    std::string event_slug;
    std::string outcome;
    int outcome_index = -1;
    std::string name;

    double notional() const { return size * price; }

    // Throws if j is not an object; missing fields take defaults.
    static TrackedEvent from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// A matched event handed from the feed monitor to the executor
struct TradeSignal {
    TrackedEvent event;
    std::string source_address; // lowercase
};

struct Position {
    std::string asset;
    std::string condition_id;
    double size = 0.0;
    double avg_price = 0.0;
    double initial_value = 0.0;
    double current_value = 0.0;
    double cash_pnl = 0.0;
    double percent_pnl = 0.0;
    double cur_price = 0.0;
    std::string title;
    std::string slug;
    std::string outcome;

    static Position from_json(const nlohmann::json& j);
};

// Skips entries that fail to parse; a non-array yields an empty list.
std::vector<Position> positions_from_json(const nlohmann::json& j);

enum class AmountKind {
    Usd,
    Shares
};

struct OrderRequest {
    Side side = Side::Buy;
    std::string token_id;
    std::string condition_id;
    double amount = 0.0;
    AmountKind amount_kind = AmountKind::Usd;
    double price = 0.0;
    std::string source_address;
    std::string source_tx_hash;

    // Stamped by the signer just before submission
    std::string funder_address;
    int signature_type = 0;

    nlohmann::json to_json() const;
};

struct OrderResult {
    bool success = false;
    std::string order_id;
    std::string message;
};
