#include "copier_service.hpp"
#include "audit_logger.hpp"
#include "beast_feed_transport.hpp"
#include "order_relay_client.hpp"
#include "trade_log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

using json = nlohmann::json;

CopierService::CopierService(const Config& config) : config_(config) {
    chain_ = std::make_shared<ChainClient>(config_);
    positions_ = std::make_shared<PositionClient>(config_);
    ledger_ = std::make_shared<DedupLedger>(static_cast<size_t>(config_.dedup_capacity));
    channel_ = std::make_shared<TradeChannel>(static_cast<size_t>(config_.channel_capacity));

    if (!config_.pg_dsn.empty()) {
        audit_ = std::make_shared<AuditLogger>(config_.pg_dsn);
    } else {
        spdlog::info("PG_DSN not set, audit trail disabled");
    }

    health_ = std::make_unique<HealthServer>(config_, [this]() { return health_status(); });
}

CopierService::~CopierService() {
    stop();
    shutdown();
}

int CopierService::run() {
    trade_log::startup(config_.user_addresses, config_.proxy_wallet);

    run_system_check(*chain_, *positions_, config_.proxy_wallet);

    auto is_safe = chain_->is_contract(config_.proxy_wallet);
    if (!is_safe) {
        spdlog::warn("Could not determine wallet type, assuming EOA");
    }
    auto signature_type = is_safe.value_or(false) ? SignatureType::GnosisSafe : SignatureType::Eoa;
    spdlog::info("Wallet type detected: {}", to_string(signature_type));

    signer_ = std::make_shared<Signer>(make_submitter(), config_.proxy_wallet, signature_type);
    executor_ = std::make_unique<TradeExecutor>(config_, ledger_, signer_, positions_, chain_, audit_);
    monitor_ = std::make_unique<FeedMonitor>(
        config_,
        [handshake = std::chrono::milliseconds(config_.request_timeout_ms),
         idle = std::chrono::milliseconds(config_.feed_idle_timeout_ms)]() {
            return std::make_unique<BeastFeedTransport>(handshake, idle);
        },
        channel_,
        stop_);

    health_->start();

    monitor_->log_startup_snapshot(*positions_, *chain_);

    for (int i = 0; i < config_.executor_workers; ++i) {
        worker_threads_.emplace_back([this]() { executor_->run_worker(*channel_, stop_); });
    }
    monitor_thread_ = std::thread(&CopierService::monitor_loop, this);

    spdlog::info("{} started.", config_.service_name);
    stop_.wait();

    shutdown();
    return gave_up_ ? kExitGaveUp : kExitOk;
}

void CopierService::stop() {
    if (!stop_.stop_requested()) {
        spdlog::info("Shutdown requested. Stopping...");
        stop_.request_stop();
    }
}

void CopierService::monitor_loop() {
    try {
        if (monitor_->run() == MonitorState::GaveUp) {
            gave_up_ = true;
        }
    } catch (const std::exception& e) {
        spdlog::critical("Feed monitor terminated: {}", e.what());
        gave_up_ = true;
    }
    stop();
}

void CopierService::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    channel_->close();

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    for (auto& worker : worker_threads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    worker_threads_.clear();

    health_->stop();

    if (executor_) {
        auto stats = executor_->stats();
        spdlog::info("Trades submitted: {}, failed: {}, skipped: {}, events forwarded: {}",
                     stats.submitted, stats.failed, stats.skipped,
                     monitor_ ? monitor_->events_forwarded() : 0);
    }
    spdlog::info("{} stopped", config_.service_name);
}

json CopierService::health_status() const {
    json status;
    status["service"] = config_.service_name;
    status["status"] = gave_up_ ? "unhealthy" : "healthy";
    status["dry_run"] = config_.dry_run || config_.order_relay_url.empty();

    if (monitor_) {
        status["monitor_state"] = to_string(monitor_->state());
        status["reconnect_attempts"] = monitor_->reconnect_attempts();
        status["events_forwarded"] = monitor_->events_forwarded();
    }
    if (executor_) {
        auto stats = executor_->stats();
        status["trades_submitted"] = stats.submitted;
        status["trades_failed"] = stats.failed;
        status["trades_skipped"] = stats.skipped;
    }
    if (audit_) {
        status["audit_db"] = audit_->check_health() ? "ok" : "error";
    }
    return status;
}

std::shared_ptr<OrderSubmitter> CopierService::make_submitter() const {
    if (config_.dry_run || config_.order_relay_url.empty()) {
        spdlog::warn("Dry run: orders are logged, not submitted");
        return std::make_shared<DryRunSubmitter>();
    }
    spdlog::info("Submitting orders through relay at {}", config_.order_relay_url);
    return std::make_shared<OrderRelayClient>(config_);
}
