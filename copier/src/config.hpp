
#pragma once
#include "sizing_policy.hpp"
#include <string>
#include <vector>

class Config {
public:
    // Service info
    std::string service_name = "copier";
    std::string log_level = "info";

    // Accounts
    std::vector<std::string> user_addresses; // tracked, lowercased
    std::string proxy_wallet;                // controlled account

    // Endpoints
    std::string feed_ws_url = "wss://ws-live-data.polymarket.com";
    std::string data_api_url = "https://data-api.polymarket.com";
    std::string rpc_url;
    std::string usdc_contract_address;

    // Order relay (signing and posting happen there)
    std::string order_relay_url;
    std::string order_relay_api_key;
    bool dry_run = false;

    // Sizing
    SizingConfig sizing;

    // Executor
    int too_old_timestamp_hours = 24;
    int dedup_capacity = 1000;
    int channel_capacity = 100;
    int executor_workers = 2;

    // Feed reconnection
    int reconnect_delay_ms = 5000;
    int reconnect_cap_factor = 5;
    int max_reconnect_attempts = 10;
    int feed_read_timeout_ms = 1000;
    int feed_idle_timeout_ms = 30000; // no traffic (pings included) for this long drops the connection

    // Outbound HTTP
    int request_timeout_ms = 10000;
    int network_retry_limit = 3;

    // Audit database (optional)
    std::string pg_dsn;

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    static Config from_env();
    void validate() const;

    // Accepts a JSON array or a comma-separated list. Throws ConfigError on an
    // address that is not 0x + 40 hex digits.
    static std::vector<std::string> parse_user_addresses(const std::string& input);

    // Reads COPY_STRATEGY and friends, honouring the legacy COPY_PERCENTAGE form.
    static SizingConfig sizing_from_env();
};
