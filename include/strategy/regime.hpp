#pragma once

/**
 * Market regime descriptor consumed by the position sizer.
 *
 * trend_strength is the weighted multi-timeframe momentum in [-1, 1],
 * confidence in [0, 1]. Volatilities are the standard deviation of
 * close-to-close returns per timeframe as a fraction (0.02 = 2%); a
 * timeframe without data reports 0 and is left out of the weighting.
 */

#include "../config/defaults.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace tradebot {
namespace strategy {

enum class RegimeCategory : uint8_t { Unknown = 0, Choppy, Ranging, Trending, StrongTrending };

inline const char* regime_to_string(RegimeCategory regime) {
    switch (regime) {
    case RegimeCategory::Choppy:
        return "CHOPPY";
    case RegimeCategory::Ranging:
        return "RANGING";
    case RegimeCategory::Trending:
        return "TRENDING";
    case RegimeCategory::StrongTrending:
        return "STRONG_TRENDING";
    default:
        return "UNKNOWN";
    }
}

struct RegimeDescriptor {
    bool known = false;
    double trend_strength = 0;
    double confidence = 0;
    double short_volatility = 0;
    double medium_volatility = 0;
    double long_volatility = 0;

    double weighted_strength() const { return std::abs(trend_strength) * confidence; }
};

inline RegimeCategory classify_regime(const RegimeDescriptor& regime) {
    if (!regime.known) {
        return RegimeCategory::Unknown;
    }
    double strength = regime.weighted_strength();
    if (strength >= config::sizing::STRONG_TREND_STRENGTH) {
        return RegimeCategory::StrongTrending;
    }
    if (strength >= config::sizing::TREND_STRENGTH) {
        return RegimeCategory::Trending;
    }
    if (strength >= config::sizing::RANGING_STRENGTH) {
        return RegimeCategory::Ranging;
    }
    return RegimeCategory::Choppy;
}

} // namespace strategy
} // namespace tradebot
