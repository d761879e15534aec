
#pragma once

#include <optional>
#include <string>
#include <vector>

enum class CopyStrategy {
    Percentage,
    Fixed,
    Adaptive
};

std::string to_string(CopyStrategy strategy);

// Unknown names fall back to Percentage.
CopyStrategy parse_copy_strategy(const std::string& name);

struct MultiplierTier {
    double min = 0.0;
    std::optional<double> max; // open-ended when absent
    double multiplier = 1.0;
};

struct SizingConfig {
    CopyStrategy strategy = CopyStrategy::Percentage;
    double copy_size = 10.0;
    double max_order_size_usd = 100.0;
    double min_order_size_usd = 1.0;
    std::optional<double> max_position_size_usd;
    std::optional<double> max_daily_volume_usd; // declared only, not enforced
    std::optional<double> adaptive_min_percent;
    std::optional<double> adaptive_max_percent;
    std::optional<double> adaptive_threshold;
    std::vector<MultiplierTier> tiered_multipliers;
    std::optional<double> trade_multiplier;

    // Throws ConfigError on inconsistent bounds.
    void validate() const;
};

struct SizingDecision {
    double trader_order_size = 0.0;
    double base_amount = 0.0;
    double final_amount = 0.0;
    CopyStrategy strategy = CopyStrategy::Percentage;
    bool capped_by_max = false;
    bool reduced_by_balance = false;
    bool below_minimum = false;
    std::string reasoning;
};

class SizingPolicy {
public:
    static constexpr double kBalanceSafetyMargin = 0.99;
    static constexpr double kDefaultAdaptiveThreshold = 500.0;

    explicit SizingPolicy(const SizingConfig& config);

    // Turns a trader's notional into the amount we attempt. Rules run in a fixed
    // order: base amount, multiplier, max order cap, position cap, balance cap,
    // minimum floor. Each rule that fires appends one clause to the reasoning.
    SizingDecision compute_order(double trader_order_size,
                                 double available_balance,
                                 double current_position_size) const;

    double adaptive_percent(double trader_order_size) const;
    double trade_multiplier(double trader_order_size) const;

    const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
};

// Parses "0-500:1.0,500+:1.5". Tiers come back sorted by min.
// Throws ConfigError naming the offending segment.
std::vector<MultiplierTier> parse_tiered_multipliers(const std::string& tiers_str);

// Linear interpolation with t clamped to [0, 1].
double lerp(double a, double b, double t);
