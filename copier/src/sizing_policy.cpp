
#include "sizing_policy.hpp"
#include "config_error.hpp"
#include "util.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>

namespace {

constexpr double kMultiplierEpsilon = 1e-9;

double parse_number(const std::string& text, const std::string& what, const std::string& segment) {
    std::string value = util::trim(text);
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid {} in tier '{}': '{}' is not a number", what, segment, value));
    }
    if (consumed != value.size() || !std::isfinite(parsed)) {
        throw ConfigError(fmt::format("Invalid {} in tier '{}': '{}' is not a number", what, segment, value));
    }
    return parsed;
}

} // namespace

std::string to_string(CopyStrategy strategy) {
    switch (strategy) {
        case CopyStrategy::Percentage: return "PERCENTAGE";
        case CopyStrategy::Fixed: return "FIXED";
        case CopyStrategy::Adaptive: return "ADAPTIVE";
    }
    return "PERCENTAGE";
}

CopyStrategy parse_copy_strategy(const std::string& name) {
    std::string upper = util::to_upper(util::trim(name));
    if (upper == "FIXED") return CopyStrategy::Fixed;
    if (upper == "ADAPTIVE") return CopyStrategy::Adaptive;
    return CopyStrategy::Percentage;
}

void SizingConfig::validate() const {
    if (copy_size < 0.0) {
        throw ConfigError(fmt::format("COPY_SIZE must not be negative (got {})", copy_size));
    }
    if (min_order_size_usd < 0.0) {
        throw ConfigError(fmt::format("MIN_ORDER_SIZE_USD must not be negative (got {})", min_order_size_usd));
    }
    if (max_order_size_usd <= 0.0) {
        throw ConfigError(fmt::format("MAX_ORDER_SIZE_USD must be positive (got {})", max_order_size_usd));
    }
    if (min_order_size_usd > max_order_size_usd) {
        throw ConfigError(fmt::format(
            "MIN_ORDER_SIZE_USD ({}) exceeds MAX_ORDER_SIZE_USD ({})", min_order_size_usd, max_order_size_usd));
    }
    if (max_position_size_usd && *max_position_size_usd < 0.0) {
        throw ConfigError("MAX_POSITION_SIZE_USD must not be negative");
    }
    if (adaptive_threshold && *adaptive_threshold <= 0.0) {
        throw ConfigError("ADAPTIVE_THRESHOLD_USD must be positive");
    }
    if (trade_multiplier && *trade_multiplier < 0.0) {
        throw ConfigError("TRADE_MULTIPLIER must not be negative");
    }
}

double lerp(double a, double b, double t) {
    t = std::max(0.0, std::min(1.0, t));
    return a + (b - a) * t;
}

SizingPolicy::SizingPolicy(const SizingConfig& config) : config_(config) {}

double SizingPolicy::adaptive_percent(double trader_order_size) const {
    double min_pct = config_.adaptive_min_percent.value_or(config_.copy_size);
    double max_pct = config_.adaptive_max_percent.value_or(config_.copy_size);
    double threshold = config_.adaptive_threshold.value_or(kDefaultAdaptiveThreshold);

    if (trader_order_size >= threshold) {
        double factor = std::min(1.0, trader_order_size / threshold - 1.0);
        return lerp(config_.copy_size, min_pct, factor);
    }
    double factor = trader_order_size / threshold;
    return lerp(max_pct, config_.copy_size, factor);
}

double SizingPolicy::trade_multiplier(double trader_order_size) const {
    const auto& tiers = config_.tiered_multipliers;
    if (!tiers.empty()) {
        for (const auto& tier : tiers) {
            if (trader_order_size < tier.min) {
                continue;
            }
            if (!tier.max || trader_order_size < *tier.max) {
                return tier.multiplier;
            }
        }
        // Below the lowest tier (or in a gap): last tier acts as the default.
        return tiers.back().multiplier;
    }
    return config_.trade_multiplier.value_or(1.0);
}

SizingDecision SizingPolicy::compute_order(double trader_order_size,
                                           double available_balance,
                                           double current_position_size) const {
    SizingDecision decision;
    decision.trader_order_size = trader_order_size;
    decision.strategy = config_.strategy;

    switch (config_.strategy) {
        case CopyStrategy::Percentage: {
            decision.base_amount = trader_order_size * (config_.copy_size / 100.0);
            decision.reasoning = fmt::format("{}% of trader's ${:.2f} = ${:.2f}",
                                             config_.copy_size, trader_order_size, decision.base_amount);
            break;
        }
        case CopyStrategy::Fixed: {
            decision.base_amount = config_.copy_size;
            decision.reasoning = fmt::format("Fixed amount: ${:.2f}", config_.copy_size);
            break;
        }
        case CopyStrategy::Adaptive: {
            double pct = adaptive_percent(trader_order_size);
            decision.base_amount = trader_order_size * (pct / 100.0);
            decision.reasoning = fmt::format("Adaptive {:.1f}% of trader's ${:.2f} = ${:.2f}",
                                             pct, trader_order_size, decision.base_amount);
            break;
        }
    }

    double multiplier = trade_multiplier(trader_order_size);
    double amount = decision.base_amount * multiplier;
    if (std::abs(multiplier - 1.0) > kMultiplierEpsilon) {
        decision.reasoning += fmt::format(" → {}x multiplier: ${:.2f} → ${:.2f}",
                                          multiplier, decision.base_amount, amount);
    }

    if (amount > config_.max_order_size_usd) {
        amount = config_.max_order_size_usd;
        decision.capped_by_max = true;
        decision.reasoning += fmt::format(" → Capped at max ${}", config_.max_order_size_usd);
    }

    if (config_.max_position_size_usd) {
        double max_position = *config_.max_position_size_usd;
        if (current_position_size + amount > max_position) {
            double allowed = std::max(0.0, max_position - current_position_size);
            if (allowed < config_.min_order_size_usd) {
                amount = 0.0;
                decision.reasoning += " → Position limit reached";
            } else {
                amount = allowed;
                decision.reasoning += " → Reduced to fit position limit";
            }
        }
    }

    double max_affordable = available_balance * kBalanceSafetyMargin;
    if (amount > max_affordable) {
        amount = max_affordable;
        decision.reduced_by_balance = true;
        decision.reasoning += fmt::format(" → Reduced to fit balance (${:.2f})", max_affordable);
    }

    // Round up to the smallest viable order rather than rejecting; callers that
    // prefer rejection check below_minimum.
    if (amount < config_.min_order_size_usd) {
        decision.below_minimum = true;
        decision.reasoning += fmt::format(" → Below minimum ${}", config_.min_order_size_usd);
        amount = config_.min_order_size_usd;
    }

    decision.final_amount = amount;
    return decision;
}

std::vector<MultiplierTier> parse_tiered_multipliers(const std::string& tiers_str) {
    std::vector<MultiplierTier> tiers;
    std::string trimmed = util::trim(tiers_str);
    if (trimmed.empty()) {
        return tiers;
    }

    for (const auto& raw_part : util::split_string(trimmed, ',')) {
        std::string part = util::trim(raw_part);
        if (part.empty()) {
            continue;
        }

        auto colon = part.find(':');
        if (colon == std::string::npos) {
            throw ConfigError(fmt::format("Invalid tier '{}': missing multiplier", part));
        }
        std::string range = util::trim(part.substr(0, colon));
        std::string mult_str = util::trim(part.substr(colon + 1));
        if (range.empty()) {
            throw ConfigError(fmt::format("Invalid tier '{}': missing range", part));
        }
        if (mult_str.find(':') != std::string::npos) {
            throw ConfigError(fmt::format("Invalid tier '{}': too many ':' separators", part));
        }

        MultiplierTier tier;
        tier.multiplier = parse_number(mult_str, "multiplier", part);
        if (tier.multiplier < 0.0) {
            throw ConfigError(fmt::format("Invalid multiplier in tier '{}': must not be negative", part));
        }

        if (util::ends_with(range, "+")) {
            tier.min = parse_number(range.substr(0, range.size() - 1), "minimum", part);
            if (tier.min < 0.0) {
                throw ConfigError(fmt::format("Invalid minimum in tier '{}': must not be negative", part));
            }
        } else {
            // Split on the first '-' after position 0 so "-5-10" reports a negative min.
            auto dash = range.find('-', 1);
            if (dash == std::string::npos) {
                throw ConfigError(fmt::format("Invalid range format in tier '{}': expected N-M or N+", part));
            }
            tier.min = parse_number(range.substr(0, dash), "minimum", part);
            double max = parse_number(range.substr(dash + 1), "maximum", part);
            if (tier.min < 0.0) {
                throw ConfigError(fmt::format("Invalid minimum in tier '{}': must not be negative", part));
            }
            if (max <= tier.min) {
                throw ConfigError(fmt::format("Invalid tier '{}': max must be greater than min", part));
            }
            tier.max = max;
        }

        tiers.push_back(tier);
    }

    std::stable_sort(tiers.begin(), tiers.end(),
                     [](const MultiplierTier& a, const MultiplierTier& b) { return a.min < b.min; });

    for (size_t i = 0; i + 1 < tiers.size(); ++i) {
        const auto& current = tiers[i];
        const auto& next = tiers[i + 1];
        if (!current.max) {
            throw ConfigError(fmt::format(
                "Tier starting at {} has no upper bound and must be the last tier", current.min));
        }
        if (*current.max > next.min) {
            throw ConfigError(fmt::format(
                "Overlapping tiers: {}-{} overlaps tier starting at {}", current.min, *current.max, next.min));
        }
    }

    return tiers;
}
