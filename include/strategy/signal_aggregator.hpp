#pragma once

#include "../config/bot_config.hpp"
#include "../exchange/market_data.hpp"
#include "../logging/async_logger.hpp"
#include "evaluation.hpp"

#include <vector>

namespace tradebot {
namespace strategy {

/**
 * SignalAggregator - weighted combination of a bot's indicators
 *
 * overall_score = sum(score_i x weight_i) / sum(weight_i) over enabled
 * indicators; confidence uses the same normalization. Indicators short
 * of history still count in the denominator with score 0, so a bot
 * does not act on a fraction of its signal set.
 *
 * A bot with a config error, no enabled indicator or zero total weight
 * gets a hold result with error set. Nothing here throws for bad data.
 *
 * Fills score, action, confidence, temperature, signals, price and
 * error. Confirmation and sizing are left for the engine.
 */
class SignalAggregator {
public:
    explicit SignalAggregator(logging::AsyncLogger* logger = nullptr) : logger_(logger) {}

    EvaluationResult aggregate(const config::BotConfig& bot, const std::vector<exchange::Candle>& candles) const;

private:
    logging::AsyncLogger* logger_;
};

} // namespace strategy
} // namespace tradebot
