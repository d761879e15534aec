
#include "dedup_ledger.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

DedupLedger::DedupLedger(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::string DedupLedger::make_key(const std::string& source_address, const std::string& tx_hash) {
    return fmt::format("{}:{}", source_address, tx_hash);
}

bool DedupLedger::check_and_insert(const std::string& source_address, const std::string& tx_hash) {
    std::string key = make_key(source_address, tx_hash);

    std::lock_guard<std::mutex> lock(mutex_);
    if (seen_.count(key) > 0) {
        return true;
    }

    seen_.insert(key);
    if (seen_.size() > capacity_) {
        spdlog::debug("Dedup ledger exceeded {} entries, resetting", capacity_);
        seen_.clear();
        seen_.insert(std::move(key));
    }
    return false;
}

size_t DedupLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}
