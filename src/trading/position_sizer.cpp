#include "../../include/trading/position_sizer.hpp"

#include <algorithm>

namespace tradebot::trading {

double PositionSizer::regime_multiplier(strategy::RegimeCategory regime) {
    using strategy::RegimeCategory;
    switch (regime) {
    case RegimeCategory::StrongTrending:
        return config::sizing::STRONG_TREND_MULT;
    case RegimeCategory::Trending:
        return config::sizing::TREND_MULT;
    case RegimeCategory::Ranging:
        return config::sizing::RANGING_MULT;
    case RegimeCategory::Choppy:
        return config::sizing::CHOPPY_MULT;
    default:
        return config::sizing::UNKNOWN_MULT;
    }
}

double PositionSizer::weighted_volatility(const strategy::RegimeDescriptor& regime) {
    const double vols[] = {regime.short_volatility, regime.medium_volatility, regime.long_volatility};
    const double weights[] = {config::sizing::VOL_WEIGHT_SHORT, config::sizing::VOL_WEIGHT_MEDIUM,
                              config::sizing::VOL_WEIGHT_LONG};

    // Missing timeframes (0) drop out and the remaining weights renormalize
    double sum = 0;
    double total = 0;
    for (int i = 0; i < 3; ++i) {
        if (vols[i] > 0) {
            sum += vols[i] * weights[i];
            total += weights[i];
        }
    }
    return total > 0 ? sum / total : 0;
}

double PositionSizer::volatility_multiplier(double vol) {
    if (vol <= 0) {
        return 1.0; // unknown
    }
    if (vol < config::sizing::LOW_VOL_PCT)
        return 1.2;
    if (vol < config::sizing::NORMAL_VOL_PCT)
        return 1.0;
    if (vol < config::sizing::HIGH_VOL_PCT)
        return 0.8;
    return 0.6;
}

double PositionSizer::confidence_multiplier(double confidence) {
    if (confidence >= 0.8)
        return 1.1;
    if (confidence >= 0.6)
        return 1.0;
    if (confidence >= 0.4)
        return 0.8;
    return 0.6;
}

SizingSnapshot PositionSizer::size(double base_size_usd, double signal_confidence,
                                   const strategy::RegimeDescriptor& regime, double min_order_usd,
                                   double max_order_usd) const {
    SizingSnapshot s;
    s.base_size_usd = base_size_usd;
    s.signal_confidence = signal_confidence;
    s.regime = strategy::classify_regime(regime);
    s.regime_multiplier = regime_multiplier(s.regime);
    s.weighted_volatility = weighted_volatility(regime);
    s.volatility_multiplier = volatility_multiplier(s.weighted_volatility);
    s.confidence_multiplier = confidence_multiplier(signal_confidence);

    s.raw_multiplier = s.regime_multiplier * s.volatility_multiplier * s.confidence_multiplier;
    s.final_multiplier = std::clamp(s.raw_multiplier, config_.min_multiplier, config_.max_multiplier);
    s.multiplier_clamped = s.final_multiplier != s.raw_multiplier;

    s.unclamped_size_usd = base_size_usd * s.final_multiplier;
    double lo = std::min(min_order_usd, max_order_usd);
    s.final_size_usd = std::clamp(s.unclamped_size_usd, lo, max_order_usd);
    s.size_clamped = s.final_size_usd != s.unclamped_size_usd;
    return s;
}

} // namespace tradebot::trading
