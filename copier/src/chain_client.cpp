#include "chain_client.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace {

const char* kBalanceOfSelector = "0x70a08231";

} // namespace

std::string encode_balance_of(const std::string& address) {
    std::string body = util::to_lower(util::strip_hex_prefix(util::trim(address)));
    if (body.size() > 64) {
        throw std::invalid_argument("Address too long for ABI encoding: " + address);
    }
    return std::string(kBalanceOfSelector) + std::string(64 - body.size(), '0') + body;
}

double parse_hex_quantity(const std::string& hex) {
    std::string digits = util::strip_hex_prefix(util::trim(hex));
    if (digits.empty()) {
        // "0x" is how some nodes encode an empty return
        return 0.0;
    }

    double value = 0.0;
    for (char c : digits) {
        int nibble;
        if (c >= '0' && c <= '9') {
            nibble = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            nibble = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            nibble = c - 'A' + 10;
        } else {
            throw std::invalid_argument("Invalid hex quantity: " + hex);
        }
        value = value * 16.0 + nibble;
    }
    return value;
}

class ChainClient::Impl {
public:
    explicit Impl(const Config& config)
        : token_address_(config.usdc_contract_address),
          timeout_ms_(config.request_timeout_ms) {
        auto parsed = util::parse_url(config.rpc_url);
        if (parsed.scheme != "http" && parsed.scheme != "https") {
            spdlog::error("Invalid RPC URL format: {}", config.rpc_url);
            throw std::runtime_error("Invalid RPC URL");
        }
        rpc_origin_ = parsed.scheme + "://" + parsed.host + ":" + parsed.port;
        rpc_path_ = parsed.target;

        spdlog::info("Chain client configured for host: {}, path: {}", parsed.host, rpc_path_);
    }

    std::optional<double> fetch_balance(const std::string& address) {
        try {
            nlohmann::json rpc_request = {
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"method", "eth_call"},
                {"params", {
                    {{"to", token_address_}, {"data", encode_balance_of(address)}},
                    "latest"
                }}
            };

            auto response = make_rpc_call(rpc_request);
            if (!response || !response->contains("result")) {
                return std::nullopt;
            }

            double raw = parse_hex_quantity(response->at("result").get<std::string>());
            double balance = raw / std::pow(10.0, kUsdcDecimals);

            spdlog::debug("Collateral balance for {}: {:.2f}", util::format_address(address), balance);
            return balance;

        } catch (const std::exception& e) {
            spdlog::error("Failed to get balance for {}: {}", util::format_address(address), e.what());
            return std::nullopt;
        }
    }

    std::optional<bool> is_contract(const std::string& address) {
        try {
            nlohmann::json rpc_request = {
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"method", "eth_getCode"},
                {"params", {address, "latest"}}
            };

            auto response = make_rpc_call(rpc_request);
            if (!response || !response->contains("result")) {
                return std::nullopt;
            }

            auto code = response->at("result").get<std::string>();
            return !util::strip_hex_prefix(code).empty();

        } catch (const std::exception& e) {
            spdlog::error("Failed to get code for {}: {}", util::format_address(address), e.what());
            return std::nullopt;
        }
    }

    std::optional<uint64_t> block_number() {
        try {
            nlohmann::json rpc_request = {
                {"jsonrpc", "2.0"},
                {"id", 1},
                {"method", "eth_blockNumber"},
                {"params", nlohmann::json::array()}
            };

            auto response = make_rpc_call(rpc_request);
            if (!response || !response->contains("result")) {
                return std::nullopt;
            }

            return static_cast<uint64_t>(parse_hex_quantity(response->at("result").get<std::string>()));

        } catch (const std::exception& e) {
            spdlog::error("Chain health check failed: {}", e.what());
            return std::nullopt;
        }
    }

private:
    std::optional<nlohmann::json> make_rpc_call(const nlohmann::json& request) const {
        try {
            httplib::Client client(rpc_origin_);
            auto timeout_sec = timeout_ms_ / 1000;
            auto timeout_usec = (timeout_ms_ % 1000) * 1000;
            client.set_connection_timeout(timeout_sec, timeout_usec);
            client.set_read_timeout(timeout_sec, timeout_usec);

            httplib::Headers headers = {
                {"Accept", "application/json"}
            };

            auto response = client.Post(rpc_path_.c_str(), headers, request.dump(), "application/json");

            if (!response || response->status != 200) {
                spdlog::error("RPC call {} failed with status: {}",
                              request.value("method", ""), response ? response->status : 0);
                return std::nullopt;
            }

            auto json_response = nlohmann::json::parse(response->body);

            if (json_response.contains("error")) {
                spdlog::error("RPC error: {}", json_response["error"].dump());
                return std::nullopt;
            }

            return json_response;

        } catch (const std::exception& e) {
            spdlog::error("RPC call exception: {}", e.what());
            return std::nullopt;
        }
    }

    std::string token_address_;
    int timeout_ms_;
    std::string rpc_origin_;
    std::string rpc_path_;
};

// Public interface implementation
ChainClient::ChainClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

ChainClient::~ChainClient() = default;

std::optional<double> ChainClient::fetch_balance(const std::string& address) {
    return pImpl_->fetch_balance(address);
}

std::optional<bool> ChainClient::is_contract(const std::string& address) {
    return pImpl_->is_contract(address);
}

std::optional<uint64_t> ChainClient::block_number() {
    return pImpl_->block_number();
}
