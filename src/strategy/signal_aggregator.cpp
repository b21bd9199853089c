#include "../../include/strategy/signal_aggregator.hpp"
#include "../../include/strategy/action_resolver.hpp"
#include "../../include/strategy/signal_calculators.hpp"

#include <algorithm>
#include <cmath>

namespace tradebot::strategy {

EvaluationResult SignalAggregator::aggregate(const config::BotConfig& bot,
                                             const std::vector<exchange::Candle>& candles) const {
    EvaluationResult result;
    result.bot_id = bot.id;
    result.pair = bot.pair;
    if (!candles.empty()) {
        result.price = candles.back().close;
    }

    if (bot.has_config_error()) {
        result.error = "invalid signal configuration: " + bot.config_error;
        LOGF_WARN(logger_, logging::LogCategory::Signal, "bot %u: %s", bot.id, result.error.c_str());
        return result;
    }

    std::vector<double> closes = exchange::closes_of(candles);

    double weighted_score = 0;
    double weighted_confidence = 0;
    double total_weight = 0;
    size_t enabled = 0;
    size_t insufficient = 0;

    for (const auto& indicator : bot.indicators) {
        if (!indicator.enabled)
            continue;
        ++enabled;

        SignalResult signal = calculate_signal(indicator, closes);
        signal.score = std::clamp(signal.score, -1.0, 1.0);
        signal.confidence = std::clamp(signal.confidence, 0.0, 1.0);
        if (signal.insufficient_data)
            ++insufficient;

        weighted_score += signal.score * indicator.weight;
        weighted_confidence += signal.confidence * indicator.weight;
        total_weight += indicator.weight;
        result.signals.push_back(std::move(signal));
    }

    if (enabled == 0) {
        result.error = "no enabled indicators";
        LOGF_WARN(logger_, logging::LogCategory::Signal, "bot %u: no enabled indicators", bot.id);
        return result;
    }
    if (total_weight <= 0) {
        result.error = "enabled indicators have zero total weight";
        LOGF_WARN(logger_, logging::LogCategory::Signal, "bot %u: zero total weight", bot.id);
        return result;
    }

    // Nothing had enough history: stay on hold whatever the thresholds are
    if (insufficient == enabled) {
        LOGF_DEBUG(logger_, logging::LogCategory::Signal, "bot %u: no indicator has enough history (%zu candles)",
                   bot.id, candles.size());
        return result;
    }

    result.overall_score = std::clamp(weighted_score / total_weight, -1.0, 1.0);
    result.confidence = std::clamp(weighted_confidence / total_weight, 0.0, 1.0);
    result.action = resolve_action(result.overall_score, bot.buy_threshold, bot.sell_threshold);
    result.temperature = classify_temperature(result.overall_score);

    if (insufficient > 0) {
        LOGF_DEBUG(logger_, logging::LogCategory::Signal, "bot %u: %zu/%zu indicators short of history (%zu candles)",
                   bot.id, insufficient, enabled, candles.size());
    }
    LOGF_DEBUG(logger_, logging::LogCategory::Signal, "bot %u %s: score=%.4f conf=%.2f -> %s (%s)", bot.id,
               bot.pair.c_str(), result.overall_score, result.confidence, action_to_string(result.action),
               temperature_to_string(result.temperature));
    return result;
}

} // namespace tradebot::strategy
