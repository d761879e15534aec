#pragma once
#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Position lookup by account address
class PositionSource {
public:
    virtual ~PositionSource() = default;

    // std::nullopt when the lookup failed after retries
    virtual std::optional<std::vector<Position>> fetch_positions(const std::string& address) = 0;
};

// GET {data_api_url}/positions?user=<address> with bounded retry and backoff
class PositionClient : public PositionSource {
public:
    explicit PositionClient(const Config& config);
    ~PositionClient() override;

    std::optional<std::vector<Position>> fetch_positions(const std::string& address) override;

    // Non-copyable
    PositionClient(const PositionClient&) = delete;
    PositionClient& operator=(const PositionClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
