#pragma once

#include "../strategy/signal.hpp"
#include "../types.hpp"
#include "defaults.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tradebot::config {

// ===== Indicator parameters =====

struct RsiConfig {
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
};

struct MovingAverageConfig {
    int fast_period = 10;
    int slow_period = 20;
};

struct MacdConfig {
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;
};

using IndicatorParams = std::variant<RsiConfig, MovingAverageConfig, MacdConfig>;

// Order matches IndicatorParams alternatives
enum class IndicatorType : uint8_t { RSI = 0, MovingAverage = 1, MACD = 2 };

inline const char* indicator_type_to_string(IndicatorType type) {
    switch (type) {
    case IndicatorType::RSI:
        return "RSI";
    case IndicatorType::MovingAverage:
        return "MA";
    case IndicatorType::MACD:
        return "MACD";
    default:
        return "UNKNOWN";
    }
}

/**
 * One entry of a bot's signal configuration. Validated once by the
 * config loader, so calculators can trust the parameters.
 */
struct IndicatorConfig {
    std::string name;
    bool enabled = true;
    double weight = 1.0;
    IndicatorParams params;

    IndicatorType type() const { return static_cast<IndicatorType>(params.index()); }
};

/**
 * Bot Configuration
 *
 * Immutable per evaluation. Mutable per-bot state (position size,
 * status changes, confirmation) lives in BotRegistry and
 * ConfirmationTracker.
 */
struct BotConfig {
    BotId id = INVALID_BOT_ID;
    std::string name;
    std::string pair;
    BotStatus status = BotStatus::Running;

    std::vector<IndicatorConfig> indicators;
    double buy_threshold = thresholds::BUY_THRESHOLD;
    double sell_threshold = thresholds::SELL_THRESHOLD;

    int confirmation_minutes = timing::CONFIRMATION_MINUTES;
    int cooldown_minutes = timing::COOLDOWN_MINUTES;

    double base_position_size_usd = sizing::BASE_POSITION_USD;
    strategy::Temperature min_temperature_to_trade = strategy::Temperature::Warm;

    uint32_t candle_granularity_sec = market::SIGNAL_GRANULARITY_SEC;
    uint32_t candle_limit = market::SIGNAL_CANDLE_LIMIT;

    // Set when signal_config failed validation; the bot then evaluates to hold
    std::string config_error;

    bool has_config_error() const { return !config_error.empty(); }

    size_t enabled_indicator_count() const {
        size_t n = 0;
        for (const auto& ind : indicators) {
            if (ind.enabled)
                ++n;
        }
        return n;
    }
};

} // namespace tradebot::config
