#include "../../include/strategy/signal_calculators.hpp"
#include "../../include/strategy/technical_indicators.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace tradebot::strategy {

namespace {

constexpr double CROSSOVER_SCORE = 0.8;
constexpr double TREND_ACTION_SCORE = 0.1;

TradeAction action_for_trend_score(double score) {
    if (score <= -TREND_ACTION_SCORE)
        return TradeAction::Buy;
    if (score >= TREND_ACTION_SCORE)
        return TradeAction::Sell;
    return TradeAction::Hold;
}

} // namespace

size_t required_closes(const config::IndicatorConfig& indicator) {
    return std::visit(
        [](const auto& cfg) -> size_t {
            using T = std::decay_t<decltype(cfg)>;
            if constexpr (std::is_same_v<T, config::RsiConfig>) {
                return static_cast<size_t>(cfg.period) + 1;
            } else if constexpr (std::is_same_v<T, config::MovingAverageConfig>) {
                return static_cast<size_t>(std::max(cfg.fast_period, cfg.slow_period)) + 1;
            } else {
                return static_cast<size_t>(cfg.slow_period + cfg.signal_period);
            }
        },
        indicator.params);
}

SignalResult calculate_rsi(const std::string& name, const config::RsiConfig& cfg, const std::vector<double>& closes) {
    auto value = indicators::rsi(closes, cfg.period);
    if (!value) {
        return SignalResult::insufficient(name, closes.size(), static_cast<size_t>(cfg.period) + 1);
    }

    SignalResult r;
    r.name = name;
    r.metadata["rsi_value"] = *value;

    if (*value <= cfg.oversold) {
        r.action = TradeAction::Buy;
        r.score = -(cfg.oversold - *value) / cfg.oversold;
        r.confidence = std::min(std::abs(r.score), 1.0);
    } else if (*value >= cfg.overbought) {
        r.action = TradeAction::Sell;
        r.score = (*value - cfg.overbought) / (100.0 - cfg.overbought);
        r.confidence = std::min(std::abs(r.score), 1.0);
    } else {
        r.action = TradeAction::Hold;
        r.score = 0;
        r.confidence = 0.1;
    }
    r.score = std::clamp(r.score, -1.0, 1.0);
    return r;
}

SignalResult calculate_ma_crossover(const std::string& name, const config::MovingAverageConfig& cfg,
                                    const std::vector<double>& closes) {
    size_t need = static_cast<size_t>(std::max(cfg.fast_period, cfg.slow_period)) + 1;
    if (closes.size() < need) {
        return SignalResult::insufficient(name, closes.size(), need);
    }

    size_t end = closes.size();
    double fast = *indicators::sma(closes, end, cfg.fast_period);
    double slow = *indicators::sma(closes, end, cfg.slow_period);
    double prev_fast = *indicators::sma(closes, end - 1, cfg.fast_period);
    double prev_slow = *indicators::sma(closes, end - 1, cfg.slow_period);

    double separation = slow != 0 ? (fast - slow) / slow : 0;

    SignalResult r;
    r.name = name;
    r.metadata["fast_ma"] = fast;
    r.metadata["slow_ma"] = slow;
    r.metadata["separation_pct"] = separation * 100.0;

    if (prev_fast <= prev_slow && fast > slow) {
        r.score = -CROSSOVER_SCORE;
        r.action = TradeAction::Buy;
        r.confidence = CROSSOVER_SCORE;
        r.metadata["crossover"] = 1;
    } else if (prev_fast >= prev_slow && fast < slow) {
        r.score = CROSSOVER_SCORE;
        r.action = TradeAction::Sell;
        r.confidence = CROSSOVER_SCORE;
        r.metadata["crossover"] = -1;
    } else {
        r.score = -std::tanh(10.0 * separation);
        r.action = action_for_trend_score(r.score);
        r.confidence = std::abs(r.score) * 0.5;
        r.metadata["crossover"] = 0;
    }
    return r;
}

SignalResult calculate_macd(const std::string& name, const config::MacdConfig& cfg,
                            const std::vector<double>& closes) {
    auto series = indicators::macd_series(closes, cfg.fast_period, cfg.slow_period, cfg.signal_period);
    if (series.size() < 2) {
        return SignalResult::insufficient(name, closes.size(),
                                          static_cast<size_t>(cfg.slow_period + cfg.signal_period));
    }

    const auto& cur = series.back();
    const auto& prev = series[series.size() - 2];
    double price = closes.back();

    SignalResult r;
    r.name = name;
    r.metadata["macd"] = cur.macd;
    r.metadata["signal"] = cur.signal;
    r.metadata["histogram"] = cur.histogram;

    if (prev.histogram <= 0 && cur.histogram > 0) {
        r.score = -CROSSOVER_SCORE;
        r.action = TradeAction::Buy;
        r.confidence = CROSSOVER_SCORE;
    } else if (prev.histogram >= 0 && cur.histogram < 0) {
        r.score = CROSSOVER_SCORE;
        r.action = TradeAction::Sell;
        r.confidence = CROSSOVER_SCORE;
    } else {
        r.score = price > 0 ? -std::tanh(1000.0 * cur.histogram / price) : 0;
        r.action = action_for_trend_score(r.score);
        r.confidence = std::abs(r.score) * 0.5;
    }
    return r;
}

SignalResult calculate_signal(const config::IndicatorConfig& indicator, const std::vector<double>& closes) {
    return std::visit(
        [&](const auto& cfg) -> SignalResult {
            using T = std::decay_t<decltype(cfg)>;
            if constexpr (std::is_same_v<T, config::RsiConfig>) {
                return calculate_rsi(indicator.name, cfg, closes);
            } else if constexpr (std::is_same_v<T, config::MovingAverageConfig>) {
                return calculate_ma_crossover(indicator.name, cfg, closes);
            } else {
                return calculate_macd(indicator.name, cfg, closes);
            }
        },
        indicator.params);
}

} // namespace tradebot::strategy
