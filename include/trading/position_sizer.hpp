#pragma once

#include "../config/defaults.hpp"
#include "../strategy/regime.hpp"

namespace tradebot {
namespace trading {

struct SizingConfig {
    double min_multiplier = config::sizing::MIN_MULTIPLIER;
    double max_multiplier = config::sizing::MAX_MULTIPLIER;
};

/**
 * Every factor behind one sizing decision
 */
struct SizingSnapshot {
    double base_size_usd = 0;
    strategy::RegimeCategory regime = strategy::RegimeCategory::Unknown;
    double regime_multiplier = 1.0;
    double weighted_volatility = 0;
    double volatility_multiplier = 1.0;
    double signal_confidence = 0;
    double confidence_multiplier = 1.0;
    double raw_multiplier = 1.0;
    double final_multiplier = 1.0;
    double unclamped_size_usd = 0;
    double final_size_usd = 0;
    bool multiplier_clamped = false;
    bool size_clamped = false;
};

/**
 * PositionSizer - regime aware order sizing
 *
 * final = clamp(base x clamp(regime x volatility x confidence,
 *                            min_multiplier, max_multiplier),
 *               min_order_usd, max_order_usd)
 *
 * Pure; safe to share between bot threads.
 */
class PositionSizer {
public:
    explicit PositionSizer(const SizingConfig& config = SizingConfig()) : config_(config) {}

    SizingSnapshot size(double base_size_usd, double signal_confidence, const strategy::RegimeDescriptor& regime,
                        double min_order_usd, double max_order_usd) const;

    static double regime_multiplier(strategy::RegimeCategory regime);
    static double weighted_volatility(const strategy::RegimeDescriptor& regime);
    static double volatility_multiplier(double weighted_volatility);
    static double confidence_multiplier(double confidence);

    const SizingConfig& config() const { return config_; }

private:
    SizingConfig config_;
};

} // namespace trading
} // namespace tradebot
