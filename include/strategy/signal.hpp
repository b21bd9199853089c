#pragma once

#include <cstdint>
#include <string>

namespace tradebot {
namespace strategy {

/**
 * Trade Action
 *
 * What a single indicator, or the aggregate of all of a bot's
 * indicators, suggests doing right now.
 */
enum class TradeAction : uint8_t {
    Hold = 0, // No action
    Buy,      // Add to position
    Sell      // Reduce position
};

inline const char* action_to_string(TradeAction action) {
    switch (action) {
    case TradeAction::Buy:
        return "buy";
    case TradeAction::Sell:
        return "sell";
    default:
        return "hold";
    }
}

inline bool is_actionable(TradeAction action) {
    return action != TradeAction::Hold;
}

/**
 * Signal Temperature
 *
 * Magnitude classification of |overall_score|. Ordered so that
 * comparisons work for minimum-temperature checks.
 */
enum class Temperature : uint8_t { Frozen = 0, Cool = 1, Warm = 2, Hot = 3 };

inline const char* temperature_to_string(Temperature t) {
    switch (t) {
    case Temperature::Frozen:
        return "FROZEN";
    case Temperature::Cool:
        return "COOL";
    case Temperature::Warm:
        return "WARM";
    case Temperature::Hot:
        return "HOT";
    default:
        return "UNKNOWN";
    }
}

inline bool string_to_temperature(const std::string& s, Temperature& out) {
    if (s == "FROZEN" || s == "frozen") {
        out = Temperature::Frozen;
    } else if (s == "COOL" || s == "cool") {
        out = Temperature::Cool;
    } else if (s == "WARM" || s == "warm") {
        out = Temperature::Warm;
    } else if (s == "HOT" || s == "hot") {
        out = Temperature::Hot;
    } else {
        return false;
    }
    return true;
}

} // namespace strategy
} // namespace tradebot
