#pragma once
#include "chain_client.hpp"
#include "config.hpp"
#include "position_client.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct CheckResult {
    std::string status; // "ok", "warning" or "error"
    std::string message;
};

struct SystemCheckReport {
    CheckResult rpc;
    CheckResult balance;
    CheckResult position_api;

    // False when any check reported an error
    bool healthy() const;
};

SystemCheckReport evaluate_system_check(std::optional<uint64_t> block_number,
                                        std::optional<double> balance,
                                        bool position_api_ok);

// Probes the RPC node, the controlled balance and the position API, and logs a table
SystemCheckReport run_system_check(ChainClient& chain, PositionSource& positions, const std::string& controlled);

// Serves GET /health on a background thread. The status provider fills in
// the body; a "status" other than "healthy" yields HTTP 503.
class HealthServer {
public:
    using StatusProvider = std::function<nlohmann::json()>;

    HealthServer(const Config& config, StatusProvider provider);
    ~HealthServer();

    void start();
    void stop();

    // Non-copyable
    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
