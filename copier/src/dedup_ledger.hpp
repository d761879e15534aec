#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

// Remembers which trades were already handled, keyed "address:txHash".
// When the set grows past capacity it is cleared and only the newest key kept.
class DedupLedger {
public:
    static constexpr size_t kDefaultCapacity = 1000;

    explicit DedupLedger(size_t capacity = kDefaultCapacity);

    // Atomically checks and records the key. Returns true if it was seen before.
    bool check_and_insert(const std::string& source_address, const std::string& tx_hash);

    size_t size() const;
    size_t capacity() const { return capacity_; }

    static std::string make_key(const std::string& source_address, const std::string& tx_hash);

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> seen_;
};
