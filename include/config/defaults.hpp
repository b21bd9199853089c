#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the bot pipeline.
 *
 * Loaded JSON overrides any of these; absent keys fall back here.
 *
 * Naming:
 * - _PCT suffix: fraction as decimal (0.01 = 1%)
 * - _USD suffix: quote-currency amount
 * - _MINUTES / _MS suffix: durations
 */

namespace tradebot::config {

// =============================================================================
// Signal Thresholds (scores below -0.3 buy, above +0.3 sell)
// =============================================================================
namespace thresholds {
constexpr double BUY_THRESHOLD = -0.3;
constexpr double SELL_THRESHOLD = 0.3;

// Temperature band lower edges on |overall_score|
constexpr double HOT = 0.30;
constexpr double WARM = 0.15;
constexpr double COOL = 0.05;
} // namespace thresholds

// =============================================================================
// Timing
// =============================================================================
namespace timing {
constexpr int CONFIRMATION_MINUTES = 5;
constexpr int COOLDOWN_MINUTES = 15;
constexpr int LOCK_TIMEOUT_MS = 2000;
constexpr int STALE_PENDING_MINUTES = 10;
} // namespace timing

// =============================================================================
// Safety Limits (global policy)
// =============================================================================
namespace safety {
constexpr double MAX_POSITION_USD = 25.0;
constexpr double MIN_POSITION_USD = 5.0;
constexpr uint32_t MAX_DAILY_TRADES = 5; // per bot
constexpr double MAX_DAILY_LOSS_USD = 100.0;
} // namespace safety

// =============================================================================
// Position Sizing
// =============================================================================
namespace sizing {
constexpr double BASE_POSITION_USD = 10.0;
constexpr double MIN_MULTIPLIER = 0.2;
constexpr double MAX_MULTIPLIER = 3.0;

// Regime strength (|trend| x confidence) lower edges
constexpr double STRONG_TREND_STRENGTH = 0.40;
constexpr double TREND_STRENGTH = 0.15;
constexpr double RANGING_STRENGTH = 0.05;

constexpr double STRONG_TREND_MULT = 1.5;
constexpr double TREND_MULT = 1.2;
constexpr double RANGING_MULT = 1.0;
constexpr double CHOPPY_MULT = 0.5;
constexpr double UNKNOWN_MULT = 1.0;

// Weighted volatility edges (fraction per candle)
constexpr double LOW_VOL_PCT = 0.01;
constexpr double NORMAL_VOL_PCT = 0.03;
constexpr double HIGH_VOL_PCT = 0.05;

// short / medium / long timeframe weights
constexpr double VOL_WEIGHT_SHORT = 0.3;
constexpr double VOL_WEIGHT_MEDIUM = 0.5;
constexpr double VOL_WEIGHT_LONG = 0.2;
} // namespace sizing

// =============================================================================
// Execution
// =============================================================================
namespace execution {
constexpr int QUANTITY_DECIMALS = 8;
constexpr double PAPER_COMMISSION_PCT = 0.006; // taker fee used by the paper broker
} // namespace execution

// =============================================================================
// Market Data
// =============================================================================
namespace market {
constexpr uint32_t SIGNAL_GRANULARITY_SEC = 3600;
constexpr uint32_t SIGNAL_CANDLE_LIMIT = 100;
} // namespace market

} // namespace tradebot::config
