#pragma once

#include "sizing_policy.hpp"
#include "types.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct AuditRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string source_address;
    TrackedEvent event;
    SizingDecision decision;
    std::string outcome; // "submitted", "failed"
    std::string details;
};

// Writes one row per attempted copy trade to copy_trade_audit. Failures are
// logged and never propagate to the trading path.
class AuditLogger {
public:
    explicit AuditLogger(std::string conn_str);
    ~AuditLogger();

    void log_trade(const AuditRecord& record);
    bool check_health();

private:
    bool connect();
    bool ensure_connected();

    std::string conn_str_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;
};
