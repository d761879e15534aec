#pragma once
#include "config.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Collateral balance of an account
class BalanceSource {
public:
    virtual ~BalanceSource() = default;

    // std::nullopt when the balance could not be read
    virtual std::optional<double> fetch_balance(const std::string& address) = 0;
};

// JSON-RPC client for the EVM chain the exchange settles on
class ChainClient : public BalanceSource {
public:
    static constexpr int kUsdcDecimals = 6;

    explicit ChainClient(const Config& config);
    ~ChainClient() override;

    // ERC-20 balanceOf on the configured collateral token, scaled by its decimals
    std::optional<double> fetch_balance(const std::string& address) override;

    // True when the address has deployed code (smart-contract wallet)
    std::optional<bool> is_contract(const std::string& address);

    // Latest block height, used as a reachability check
    std::optional<uint64_t> block_number();

    // Non-copyable
    ChainClient(const ChainClient&) = delete;
    ChainClient& operator=(const ChainClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// balanceOf(address) call data: selector followed by the left-padded address
std::string encode_balance_of(const std::string& address);

// Parses a 0x-prefixed hex quantity into a double; throws std::invalid_argument
double parse_hex_quantity(const std::string& hex);
