#pragma once

/**
 * Action Resolver
 *
 * Stateless mapping from an aggregate score to a trade action and a
 * temperature. Scores at or below buy_threshold buy, at or above
 * sell_threshold sell. Temperature bands use inclusive lower edges on
 * |score|: 0.30 HOT, 0.15 WARM, 0.05 COOL, below that FROZEN.
 */

#include "../config/defaults.hpp"
#include "signal.hpp"

#include <algorithm>
#include <cmath>

namespace tradebot {
namespace strategy {

inline TradeAction resolve_action(double score, double buy_threshold, double sell_threshold) {
    if (score <= buy_threshold) {
        return TradeAction::Buy;
    }
    if (score >= sell_threshold) {
        return TradeAction::Sell;
    }
    return TradeAction::Hold;
}

inline Temperature classify_temperature(double score) {
    double magnitude = std::abs(score);
    if (magnitude >= config::thresholds::HOT) {
        return Temperature::Hot;
    }
    if (magnitude >= config::thresholds::WARM) {
        return Temperature::Warm;
    }
    if (magnitude >= config::thresholds::COOL) {
        return Temperature::Cool;
    }
    return Temperature::Frozen;
}

inline bool meets_temperature(Temperature actual, Temperature required) {
    return actual >= required;
}

/**
 * How far a score sits from triggering either action.
 */
struct ActionDistance {
    double to_buy = 0;  // score - buy_threshold, <= 0 inside the buy zone
    double to_sell = 0; // sell_threshold - score, <= 0 inside the sell zone
    double nearest = 0; // distance to the closer threshold, 0 inside a zone
    TradeAction nearest_action = TradeAction::Hold;
    bool in_buy_zone = false;
    bool in_sell_zone = false;
    bool in_neutral_zone = true;
};

inline ActionDistance distance_to_action(double score, double buy_threshold, double sell_threshold) {
    ActionDistance d;
    d.to_buy = score - buy_threshold;
    d.to_sell = sell_threshold - score;
    d.in_buy_zone = d.to_buy <= 0;
    d.in_sell_zone = d.to_sell <= 0;
    d.in_neutral_zone = !d.in_buy_zone && !d.in_sell_zone;

    if (d.to_buy <= d.to_sell) {
        d.nearest_action = TradeAction::Buy;
        d.nearest = std::max(d.to_buy, 0.0);
    } else {
        d.nearest_action = TradeAction::Sell;
        d.nearest = std::max(d.to_sell, 0.0);
    }
    return d;
}

} // namespace strategy
} // namespace tradebot
