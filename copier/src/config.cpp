#include "config.hpp"
#include "config_error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cmath>
#include <optional>

namespace {

std::optional<double> get_env_double(const std::string& name) {
    if (!util::has_env_var(name)) {
        return std::nullopt;
    }
    std::string value = util::trim(util::get_env_var(name));
    if (value.empty()) {
        return std::nullopt;
    }
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid numeric value for {}: '{}'", name, value));
    }
    if (consumed != value.size() || !std::isfinite(parsed)) {
        throw ConfigError(fmt::format("Invalid numeric value for {}: '{}'", name, value));
    }
    return parsed;
}

double get_env_double(const std::string& name, double default_value) {
    return get_env_double(name).value_or(default_value);
}

int get_env_int(const std::string& name, int default_value) {
    std::string value = util::trim(util::get_env_var(name));
    if (value.empty()) {
        return default_value;
    }
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid integer value for {}: '{}'", name, value));
    }
    if (consumed != value.size()) {
        throw ConfigError(fmt::format("Invalid integer value for {}: '{}'", name, value));
    }
    return parsed;
}

bool get_env_bool(const std::string& name, bool default_value) {
    std::string value = util::trim(util::get_env_var(name));
    if (value.empty()) {
        return default_value;
    }
    return util::iequals(value, "true") || value == "1" || util::iequals(value, "yes");
}

std::string get_required(const std::string& name) {
    try {
        return util::trim(util::get_required_env_var(name));
    } catch (const std::runtime_error& e) {
        throw ConfigError(fmt::format("{}. Set it in the environment before starting", e.what()));
    }
}

std::optional<double> multiplier_if_not_one(double multiplier) {
    if (std::abs(multiplier - 1.0) > 1e-9) {
        return multiplier;
    }
    return std::nullopt;
}

} // namespace

std::vector<std::string> Config::parse_user_addresses(const std::string& input) {
    std::string trimmed = util::trim(input);
    std::vector<std::string> raw;

    if (util::starts_with(trimmed, "[") && util::ends_with(trimmed, "]")) {
        try {
            raw = nlohmann::json::parse(trimmed).get<std::vector<std::string>>();
        } catch (const std::exception& e) {
            throw ConfigError(fmt::format("Invalid JSON format for USER_ADDRESSES: {}", e.what()));
        }
    } else {
        raw = util::split_string(trimmed, ',');
    }

    std::vector<std::string> addresses;
    for (const auto& entry : raw) {
        std::string address = util::to_lower(util::trim(entry));
        if (address.empty()) {
            continue;
        }
        if (!util::is_valid_evm_address(address)) {
            throw ConfigError(fmt::format("Invalid Ethereum address in USER_ADDRESSES: {}", address));
        }
        // Feed wallets always carry the prefix
        addresses.push_back(util::starts_with(address, "0x") ? address : "0x" + address);
    }
    return addresses;
}

SizingConfig Config::sizing_from_env() {
    SizingConfig sizing;
    sizing.max_order_size_usd = get_env_double("MAX_ORDER_SIZE_USD", 100.0);
    sizing.min_order_size_usd = get_env_double("MIN_ORDER_SIZE_USD", 1.0);
    sizing.max_position_size_usd = get_env_double("MAX_POSITION_SIZE_USD");
    sizing.max_daily_volume_usd = get_env_double("MAX_DAILY_VOLUME_USD");

    bool legacy = util::has_env_var("COPY_PERCENTAGE") && !util::has_env_var("COPY_STRATEGY");
    if (legacy) {
        // Older deployments: multiplier folded into the percentage.
        double copy_pct = get_env_double("COPY_PERCENTAGE", 10.0);
        double trade_mult = get_env_double("TRADE_MULTIPLIER", 1.0);
        sizing.strategy = CopyStrategy::Percentage;
        sizing.copy_size = copy_pct * trade_mult;
        sizing.trade_multiplier = multiplier_if_not_one(trade_mult);
        spdlog::warn("COPY_PERCENTAGE is deprecated, use COPY_STRATEGY=PERCENTAGE with COPY_SIZE");
    } else {
        sizing.strategy = parse_copy_strategy(util::get_env_var("COPY_STRATEGY", "PERCENTAGE"));
        sizing.copy_size = get_env_double("COPY_SIZE", 10.0);
        if (auto mult = get_env_double("TRADE_MULTIPLIER")) {
            sizing.trade_multiplier = multiplier_if_not_one(*mult);
        }
    }

    if (util::has_env_var("TIERED_MULTIPLIERS")) {
        sizing.tiered_multipliers = parse_tiered_multipliers(util::get_env_var("TIERED_MULTIPLIERS"));
    }

    if (sizing.strategy == CopyStrategy::Adaptive) {
        sizing.adaptive_min_percent = get_env_double("ADAPTIVE_MIN_PERCENT", sizing.copy_size);
        sizing.adaptive_max_percent = get_env_double("ADAPTIVE_MAX_PERCENT", sizing.copy_size);
        sizing.adaptive_threshold = get_env_double("ADAPTIVE_THRESHOLD_USD", SizingPolicy::kDefaultAdaptiveThreshold);
    }

    return sizing;
}

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", "copier");
    config.log_level = util::to_lower(util::trim(util::get_env_var("LOG_LEVEL", "info")));

    // Accounts
    config.user_addresses = parse_user_addresses(get_required("USER_ADDRESSES"));
    config.proxy_wallet = get_required("PROXY_WALLET");

    // Endpoints
    config.feed_ws_url = util::trim(util::get_env_var("FEED_WS_URL", config.feed_ws_url));
    config.data_api_url = util::trim(util::get_env_var("DATA_API_URL", config.data_api_url));
    while (util::ends_with(config.data_api_url, "/")) {
        config.data_api_url.pop_back();
    }
    config.rpc_url = get_required("RPC_URL");
    config.usdc_contract_address = get_required("USDC_CONTRACT_ADDRESS");

    // Order relay
    config.order_relay_url = util::trim(util::get_env_var("ORDER_RELAY_URL"));
    while (util::ends_with(config.order_relay_url, "/")) {
        config.order_relay_url.pop_back();
    }
    config.order_relay_api_key = util::trim(util::get_env_var("ORDER_RELAY_API_KEY"));
    config.dry_run = get_env_bool("DRY_RUN", false);

    // Sizing
    config.sizing = sizing_from_env();

    // Executor
    config.too_old_timestamp_hours = get_env_int("TOO_OLD_TIMESTAMP", config.too_old_timestamp_hours);
    config.dedup_capacity = get_env_int("DEDUP_CAPACITY", config.dedup_capacity);
    config.channel_capacity = get_env_int("CHANNEL_CAPACITY", config.channel_capacity);
    config.executor_workers = get_env_int("EXECUTOR_WORKERS", config.executor_workers);

    // Feed
    config.reconnect_delay_ms = get_env_int("RECONNECT_DELAY_MS", config.reconnect_delay_ms);
    config.reconnect_cap_factor = get_env_int("RECONNECT_CAP_FACTOR", config.reconnect_cap_factor);
    config.max_reconnect_attempts = get_env_int("MAX_RECONNECT_ATTEMPTS", config.max_reconnect_attempts);
    config.feed_read_timeout_ms = get_env_int("FEED_READ_TIMEOUT_MS", config.feed_read_timeout_ms);
    config.feed_idle_timeout_ms = get_env_int("FEED_IDLE_TIMEOUT_MS", config.feed_idle_timeout_ms);

    // HTTP
    config.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", config.request_timeout_ms);
    config.network_retry_limit = get_env_int("NETWORK_RETRY_LIMIT", config.network_retry_limit);

    // Audit
    config.pg_dsn = util::trim(util::get_env_var("PG_DSN"));

    // Health
    config.health_host = util::get_env_var("HEALTH_HOST", config.health_host);
    config.health_port = get_env_int("HEALTH_PORT", config.health_port);

    return config;
}

void Config::validate() const {
    // spdlog maps unknown names to "off", which would silence the service
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw ConfigError("Invalid LOG_LEVEL: " + log_level +
                          " (expected trace, debug, info, warn, error, critical or off)");
    }

    if (user_addresses.empty()) {
        throw ConfigError("USER_ADDRESSES must contain at least one address");
    }

    if (!util::is_valid_evm_address(proxy_wallet)) {
        throw ConfigError("Invalid PROXY_WALLET: " + proxy_wallet);
    }

    if (!util::is_valid_evm_address(usdc_contract_address)) {
        throw ConfigError("Invalid USDC_CONTRACT_ADDRESS: " + usdc_contract_address);
    }

    if (!util::starts_with(feed_ws_url, "wss://") && !util::starts_with(feed_ws_url, "ws://")) {
        throw ConfigError("FEED_WS_URL must start with ws:// or wss://");
    }

    if (!util::starts_with(rpc_url, "https://") && !util::starts_with(rpc_url, "http://")) {
        throw ConfigError("RPC_URL must start with http:// or https://");
    }

    sizing.validate();

    if (too_old_timestamp_hours <= 0) {
        throw ConfigError("TOO_OLD_TIMESTAMP must be a positive number of hours");
    }

    if (dedup_capacity < 1) {
        throw ConfigError("DEDUP_CAPACITY must be at least 1");
    }

    if (channel_capacity < 1) {
        throw ConfigError("CHANNEL_CAPACITY must be at least 1");
    }

    if (executor_workers < 1 || executor_workers > 32) {
        throw ConfigError("EXECUTOR_WORKERS must be between 1 and 32");
    }

    if (reconnect_delay_ms < 0 || reconnect_cap_factor < 1 || max_reconnect_attempts < 1) {
        throw ConfigError("Reconnect settings must be non-negative delay, cap factor >= 1 and attempts >= 1");
    }

    if (feed_read_timeout_ms < 10) {
        throw ConfigError("FEED_READ_TIMEOUT_MS must be at least 10");
    }

    if (feed_idle_timeout_ms <= feed_read_timeout_ms) {
        throw ConfigError("FEED_IDLE_TIMEOUT_MS must be greater than FEED_READ_TIMEOUT_MS");
    }

    if (request_timeout_ms <= 0 || network_retry_limit < 1) {
        throw ConfigError("REQUEST_TIMEOUT_MS must be positive and NETWORK_RETRY_LIMIT at least 1");
    }

    if (health_port < 0 || health_port > 65535) {
        throw ConfigError("HEALTH_PORT must be between 0 and 65535");
    }

    if (sizing.max_daily_volume_usd) {
        spdlog::warn("MAX_DAILY_VOLUME_USD is set but daily volume is not enforced");
    }

    spdlog::info("Configuration validated successfully");
}
