#include "health.hpp"
#include "trade_log.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <atomic>
#include <thread>

// A zero address has no positions but still exercises the endpoint
static const char* kProbeAddress = "0x0000000000000000000000000000000000000000";

bool SystemCheckReport::healthy() const {
    return rpc.status != "error" && balance.status != "error" && position_api.status != "error";
}

SystemCheckReport evaluate_system_check(std::optional<uint64_t> block_number,
                                        std::optional<double> balance,
                                        bool position_api_ok) {
    SystemCheckReport report;

    if (block_number) {
        report.rpc = {"ok", fmt::format("block {}", *block_number)};
    } else {
        report.rpc = {"error", "RPC endpoint unreachable"};
    }

    if (!balance) {
        report.balance = {"error", "balance lookup failed"};
    } else if (*balance > 0.0) {
        report.balance = {"ok", fmt::format("${:.2f}", *balance)};
    } else {
        report.balance = {"warning", "balance is zero, orders will fail"};
    }

    report.position_api = position_api_ok ? CheckResult{"ok", "reachable"}
                                          : CheckResult{"error", "position API unreachable"};
    return report;
}

SystemCheckReport run_system_check(ChainClient& chain, PositionSource& positions, const std::string& controlled) {
    spdlog::info("Running system check...");

    auto report = evaluate_system_check(chain.block_number(),
                                        chain.fetch_balance(controlled),
                                        positions.fetch_positions(kProbeAddress).has_value());

    trade_log::separator();
    spdlog::info("SYSTEM CHECK");
    trade_log::health_line("Overall", report.healthy() ? "ok" : "error",
                           report.healthy() ? "All systems go" : "Degraded, check items below");
    trade_log::health_line("RPC", report.rpc.status, report.rpc.message);
    trade_log::health_line("Balance", report.balance.status, report.balance.message);
    trade_log::health_line("Position API", report.position_api.status, report.position_api.message);
    trade_log::separator();

    if (!report.healthy()) {
        spdlog::warn("System check reported issues; continuing anyway.");
    }
    return report;
}

class HealthServer::Impl {
public:
    Impl(const Config& config, StatusProvider provider)
        : host_(config.health_host), port_(config.health_port), provider_(std::move(provider)) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            spdlog::warn("Health server already running");
            return;
        }
        if (port_ == 0) {
            spdlog::info("Health server disabled (HEALTH_PORT=0)");
            return;
        }

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json health_status;
            try {
                health_status = provider_();
            } catch (const std::exception& e) {
                health_status = {{"status", "unhealthy"}, {"error", e.what()}};
            }
            health_status["timestamp"] = util::current_iso8601();

            res.status = health_status.value("status", "") == "healthy" ? 200 : 503;
            res.set_content(health_status.dump(2), "application/json");
        });

        // Bind before spawning so stop() always finds a listening socket
        if (!server_.bind_to_port(host_.c_str(), port_)) {
            spdlog::error("Failed to start health server on {}:{}", host_, port_);
            return;
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            spdlog::info("Health check server listening on {}:{}", host_, port_);
            server_.listen_after_bind();
        });
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Health check server stopped");
    }

private:
    std::string host_;
    int port_;
    StatusProvider provider_;
    httplib::Server server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

HealthServer::HealthServer(const Config& config, StatusProvider provider)
    : pImpl_(std::make_unique<Impl>(config, std::move(provider))) {}

HealthServer::~HealthServer() = default;

void HealthServer::start() {
    pImpl_->start();
}

void HealthServer::stop() {
    pImpl_->stop();
}
