#include "audit_logger.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace {

const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS copy_trade_audit ("
    "  id BIGSERIAL PRIMARY KEY,"
    "  timestamp TIMESTAMPTZ NOT NULL,"
    "  source_address TEXT NOT NULL,"
    "  tx_hash TEXT NOT NULL,"
    "  condition_id TEXT,"
    "  side TEXT,"
    "  trader_notional DOUBLE PRECISION,"
    "  final_amount DOUBLE PRECISION,"
    "  strategy TEXT,"
    "  flags JSONB,"
    "  reasoning TEXT,"
    "  outcome TEXT,"
    "  details TEXT,"
    "  raw_event JSONB"
    ")";

} // namespace

AuditLogger::AuditLogger(std::string conn_str) : conn_str_(std::move(conn_str)) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (connect()) {
        try {
            pqxx::work w(*conn_);
            w.exec(kCreateTable);
            w.commit();
        } catch (const std::exception& e) {
            spdlog::error("Failed to prepare copy_trade_audit table: {}", e.what());
        }
    }
}

AuditLogger::~AuditLogger() {
    if (conn_ && conn_->is_open()) {
        conn_->close();
    }
}

bool AuditLogger::connect() {
    try {
        conn_ = std::make_unique<pqxx::connection>(conn_str_);
        spdlog::info("Successfully connected to audit database.");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to audit database: {}", e.what());
        conn_.reset();
        return false;
    }
}

bool AuditLogger::ensure_connected() {
    if (!conn_ || !conn_->is_open()) {
        return connect();
    }
    return true;
}

bool AuditLogger::check_health() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connected()) {
        return false;
    }
    try {
        pqxx::nontransaction n(*conn_);
        n.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Audit database health check failed: {}", e.what());
        return false;
    }
}

void AuditLogger::log_trade(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!ensure_connected()) {
        spdlog::error("Cannot write audit record, database connection is down.");
        return;
    }

    nlohmann::json flags = {
        {"capped_by_max", record.decision.capped_by_max},
        {"reduced_by_balance", record.decision.reduced_by_balance},
        {"below_minimum", record.decision.below_minimum}
    };

    try {
        pqxx::work w(*conn_);
        w.exec_params(
            "INSERT INTO copy_trade_audit (timestamp, source_address, tx_hash, condition_id, side, "
            "trader_notional, final_amount, strategy, flags, reasoning, outcome, details, raw_event) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::jsonb, $10, $11, $12, $13::jsonb)",
            util::format_timestamp(record.timestamp),
            record.source_address,
            record.event.transaction_hash,
            record.event.condition_id,
            to_string(record.event.side),
            record.decision.trader_order_size,
            record.decision.final_amount,
            to_string(record.decision.strategy),
            flags.dump(),
            record.decision.reasoning,
            record.outcome,
            record.details,
            record.event.to_json().dump()
        );
        w.commit();
    } catch (const std::exception& e) {
        spdlog::error("Failed to write audit record to database: {}", e.what());
    }
}
