#pragma once

/**
 * Safety Policy - global trading limits
 *
 * Limits are read-only for the pipeline. The executor evaluates them
 * with check_safety() inside the per-bot critical section.
 *
 * Checks, in order:
 * 1. Order size within [min_position_usd, max_position_usd]
 * 2. Signal temperature at or above max(bot minimum, policy minimum)
 * 3. Bot's trades today below max_daily_trades
 * 4. Bot's realized loss today below max_daily_loss_usd
 */

#include "../config/defaults.hpp"
#include "../errors.hpp"
#include "../strategy/signal.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <mutex>

namespace tradebot {
namespace risk {

struct SafetyLimits {
    double max_position_usd = config::safety::MAX_POSITION_USD;
    double min_position_usd = config::safety::MIN_POSITION_USD;
    uint32_t max_daily_trades = config::safety::MAX_DAILY_TRADES;
    double max_daily_loss_usd = config::safety::MAX_DAILY_LOSS_USD;
    strategy::Temperature min_temperature = strategy::Temperature::Warm;
};

class ISafetyPolicy {
public:
    virtual ~ISafetyPolicy() = default;
    virtual SafetyLimits limits() const = 0;
};

/**
 * Fixed limits, replaceable at runtime (e.g. on config reload)
 */
class StaticSafetyPolicy : public ISafetyPolicy {
public:
    StaticSafetyPolicy() = default;
    explicit StaticSafetyPolicy(const SafetyLimits& limits) : limits_(limits) {}

    SafetyLimits limits() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return limits_;
    }

    void set_limits(const SafetyLimits& limits) {
        std::lock_guard<std::mutex> lock(mutex_);
        limits_ = limits;
    }

private:
    mutable std::mutex mutex_;
    SafetyLimits limits_;
};

/**
 * Per-bot activity for the current UTC day
 */
struct DailyActivity {
    uint32_t trade_count = 0;
    double realized_loss_usd = 0; // positive number, 0 if the day is flat or profitable
};

/**
 * Pre-trade safety check.
 *
 * @return RejectReason::None if the order may proceed
 */
inline RejectReason check_safety(const SafetyLimits& limits, double size_usd, strategy::Temperature temperature,
                                 strategy::Temperature bot_min_temperature, const DailyActivity& today) {
    if (!std::isfinite(size_usd) || size_usd <= 0) {
        return RejectReason::InvalidSize;
    }
    if (size_usd < limits.min_position_usd) {
        return RejectReason::SizeBelowMinimum;
    }
    if (size_usd > limits.max_position_usd) {
        return RejectReason::SizeAboveMaximum;
    }

    strategy::Temperature required = std::max(bot_min_temperature, limits.min_temperature);
    if (temperature < required) {
        return RejectReason::TemperatureTooLow;
    }

    if (today.trade_count >= limits.max_daily_trades) {
        return RejectReason::DailyTradeLimit;
    }
    if (today.realized_loss_usd >= limits.max_daily_loss_usd) {
        return RejectReason::DailyLossLimit;
    }
    return RejectReason::None;
}

} // namespace risk
} // namespace tradebot
