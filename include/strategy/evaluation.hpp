#pragma once

#include "../trading/position_sizer.hpp"
#include "../types.hpp"
#include "confirmation_tracker.hpp"
#include "regime.hpp"
#include "signal_result.hpp"

#include <string>
#include <vector>

namespace tradebot {
namespace strategy {

/**
 * One evaluation of one bot. Produced every cycle, appended to the
 * bot's history and never mutated afterwards.
 */
struct EvaluationResult {
    BotId bot_id = INVALID_BOT_ID;
    std::string pair;
    double overall_score = 0;
    TradeAction action = TradeAction::Hold;
    double confidence = 0;
    Temperature temperature = Temperature::Frozen;
    std::vector<SignalResult> signals;
    ConfirmationStatus confirmation;
    RegimeDescriptor regime;
    trading::SizingSnapshot sizing;
    double price = 0; // last close, 0 without market data
    Timestamp timestamp = NO_TIMESTAMP;
    std::string error; // empty unless the evaluation could not use the bot's signals

    bool has_error() const { return !error.empty(); }
};

} // namespace strategy
} // namespace tradebot
