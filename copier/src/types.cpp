#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

// The data API sends most numbers as JSON numbers, but some fields arrive as
// strings depending on the endpoint.
double number_field(const nlohmann::json& j, const char* key, double default_value = 0.0) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_value;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return default_value;
        }
    }
    return default_value;
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

int64_t integer_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

std::string to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

TrackedEvent TrackedEvent::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("activity payload is not an object");
    }

    TrackedEvent event;
    event.timestamp = integer_field(j, "timestamp");
    event.proxy_wallet = string_field(j, "proxyWallet");
    event.condition_id = string_field(j, "conditionId");
    event.asset = string_field(j, "asset");
    event.side_raw = string_field(j, "side");
    event.side = util::iequals(event.side_raw, "BUY") ? Side::Buy : Side::Sell;
    event.size = number_field(j, "size");
    event.price = number_field(j, "price");
    event.transaction_hash = string_field(j, "transactionHash");
    event.title = string_field(j, "title");
    event.slug = string_field(j, "slug");
    event.event_slug = string_field(j, "eventSlug");
    event.outcome = string_field(j, "outcome");
    event.outcome_index = static_cast<int>(integer_field(j, "outcomeIndex"));
    event.name = string_field(j, "name");
    return event;
}

nlohmann::json TrackedEvent::to_json() const {
    return {
        {"timestamp", timestamp},
        {"proxyWallet", proxy_wallet},
        {"conditionId", condition_id},
        {"asset", asset},
        {"side", to_string(side)},
        {"size", size},
        {"price", price},
        {"usdcSize", notional()},
        {"transactionHash", transaction_hash},
        {"title", title},
        {"slug", slug},
        {"eventSlug", event_slug},
        {"outcome", outcome},
        {"outcomeIndex", outcome_index},
        {"name", name}
    };
}

Position Position::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("position entry is not an object");
    }

    Position position;
    position.asset = string_field(j, "asset");
    position.condition_id = string_field(j, "conditionId");
    position.size = number_field(j, "size");
    position.avg_price = number_field(j, "avgPrice");
    position.initial_value = number_field(j, "initialValue");
    position.current_value = number_field(j, "currentValue");
    position.cash_pnl = number_field(j, "cashPnl");
    position.percent_pnl = number_field(j, "percentPnl");
    position.cur_price = number_field(j, "curPrice");
    position.title = string_field(j, "title");
    position.slug = string_field(j, "slug");
    position.outcome = string_field(j, "outcome");
    return position;
}

std::vector<Position> positions_from_json(const nlohmann::json& j) {
    std::vector<Position> positions;
    if (!j.is_array()) {
        return positions;
    }

    for (const auto& item : j) {
        try {
            positions.push_back(Position::from_json(item));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed position entry: {}", e.what());
        }
    }
    return positions;
}

nlohmann::json OrderRequest::to_json() const {
    return {
        {"side", to_string(side)},
        {"tokenId", token_id},
        {"conditionId", condition_id},
        {"amount", amount},
        {"amountKind", amount_kind == AmountKind::Usd ? "USD" : "SHARES"},
        {"price", price},
        {"sourceAddress", source_address},
        {"sourceTxHash", source_tx_hash},
        {"funder", funder_address},
        {"signatureType", signature_type}
    };
}
