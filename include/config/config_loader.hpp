#pragma once

/**
 * JSON configuration loader
 *
 * Document layout (every section optional, absent keys use defaults.hpp):
 *
 *   {
 *     "safety":   { "max_position_usd": 25, "min_position_usd": 5,
 *                   "max_daily_trades": 5, "max_daily_loss_usd": 100,
 *                   "min_temperature": "WARM" },
 *     "sizing":   { "min_multiplier": 0.2, "max_multiplier": 3.0 },
 *     "executor": { "lock_timeout_ms": 2000, "stale_pending_minutes": 10 },
 *     "bots": [
 *       { "id": 1, "name": "btc-momentum", "pair": "BTC-USD",
 *         "buy_threshold": -0.3, "sell_threshold": 0.3,
 *         "confirmation_minutes": 5, "cooldown_minutes": 15,
 *         "position_size_usd": 10, "min_temperature": "WARM",
 *         "signal_config": {
 *           "rsi":            { "enabled": true, "weight": 0.4, "period": 14,
 *                               "buy_threshold": 30, "sell_threshold": 70 },
 *           "moving_average": { "enabled": true, "weight": 0.3,
 *                               "fast_period": 10, "slow_period": 20 },
 *           "macd":           { "enabled": true, "weight": 0.3, "fast_period": 12,
 *                               "slow_period": 26, "signal_period": 9 } } } ]
 *   }
 *
 * signal_config may also be an array of objects carrying "type" (and
 * optionally "name"), which keeps indicator order. Indicators default to
 * disabled unless "enabled" is true.
 *
 * Errors throw ValidationError. A bot whose signal_config alone is bad
 * still loads, with config_error set, so it evaluates to hold.
 */

#include "../errors.hpp"
#include "../execution/trade_executor.hpp"
#include "../risk/safety_policy.hpp"
#include "../trading/position_sizer.hpp"
#include "bot_config.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tradebot::config {

struct AppConfig {
    risk::SafetyLimits safety;
    trading::SizingConfig sizing;
    ::tradebot::execution::ExecutorConfig executor;
    std::vector<BotConfig> bots;
};

IndicatorConfig parse_indicator(const std::string& key, const nlohmann::json& j);
std::vector<IndicatorConfig> parse_signal_config(const nlohmann::json& j);

BotConfig parse_bot_config(const nlohmann::json& j);
risk::SafetyLimits parse_safety_limits(const nlohmann::json& j);
trading::SizingConfig parse_sizing_config(const nlohmann::json& j);
::tradebot::execution::ExecutorConfig parse_executor_config(const nlohmann::json& j);

AppConfig parse_app_config(const nlohmann::json& j);
AppConfig load_config_string(const std::string& text);
AppConfig load_config_file(const std::string& path);

} // namespace tradebot::config
