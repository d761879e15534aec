#include "order_relay_client.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

OrderRelayClient::OrderRelayClient(const Config& config)
    : api_key_(config.order_relay_api_key),
      timeout_ms_(config.request_timeout_ms) {
    std::string base = config.order_relay_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    order_url_ = base + "/order";
}

OrderResult OrderRelayClient::submit(const OrderRequest& request) {
    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers["X-Api-Key"] = api_key_;
    }

    auto response = cpr::Post(
        cpr::Url{order_url_},
        headers,
        cpr::Body{request.to_json().dump()},
        cpr::Timeout{timeout_ms_}
    );

    if (response.error) {
        spdlog::error("Order relay request failed: {}", response.error.message);
        OrderResult result;
        result.message = response.error.message;
        return result;
    }

    auto result = parse_reply(response.status_code, response.text);
    if (!result.success) {
        spdlog::error("Order relay rejected order (HTTP {}): {}", response.status_code, result.message);
    }
    return result;
}

OrderResult OrderRelayClient::parse_reply(long status_code, const std::string& body) {
    OrderResult result;

    nlohmann::json reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        reply = nlohmann::json::object();
    }

    if (reply.contains("orderID") && reply["orderID"].is_string()) {
        result.order_id = reply["orderID"].get<std::string>();
    } else if (reply.contains("orderId") && reply["orderId"].is_string()) {
        result.order_id = reply["orderId"].get<std::string>();
    }

    if (reply.contains("errorMsg") && reply["errorMsg"].is_string()) {
        result.message = reply["errorMsg"].get<std::string>();
    } else if (reply.contains("error") && reply["error"].is_string()) {
        result.message = reply["error"].get<std::string>();
    } else if (reply.contains("message") && reply["message"].is_string()) {
        result.message = reply["message"].get<std::string>();
    }

    bool status_ok = status_code >= 200 && status_code < 300;
    bool flagged_ok = !reply.contains("success") || !reply["success"].is_boolean() || reply["success"].get<bool>();
    result.success = status_ok && flagged_ok;

    if (!result.success && result.message.empty()) {
        result.message = status_ok ? "relay reported failure" : "HTTP " + std::to_string(status_code);
    }
    return result;
}
