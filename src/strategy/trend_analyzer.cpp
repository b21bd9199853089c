#include "../../include/strategy/trend_analyzer.hpp"
#include "../../include/strategy/technical_indicators.hpp"

#include <algorithm>
#include <stdexcept>

namespace tradebot {
namespace strategy {

TrendAnalyzer::TrendAnalyzer(const TrendAnalyzerConfig& config, logging::AsyncLogger* logger)
    : config_(config), logger_(logger) {}

TimeframeTrend TrendAnalyzer::timeframe_trend(const std::vector<exchange::Candle>& candles) const {
    TimeframeTrend tf;
    tf.data_points = candles.size();
    if (candles.size() < config_.min_candles) {
        return tf;
    }
    std::vector<double> closes = exchange::closes_of(candles);
    tf.valid = true;
    tf.momentum = indicators::momentum(closes);
    tf.volatility = indicators::return_volatility(closes);
    return tf;
}

MaAlignment TrendAnalyzer::ma_alignment(const std::vector<double>& closes) {
    auto ma5 = indicators::sma(closes, 5);
    auto ma20 = indicators::sma(closes, 20);
    auto ma50 = indicators::sma(closes, 50);
    if (!ma5 || !ma20 || !ma50) {
        return MaAlignment::Neutral;
    }

    double price = closes.back();
    if (price > *ma5 && *ma5 > *ma20 && *ma20 > *ma50) {
        return MaAlignment::Bullish;
    }
    if (price < *ma5 && *ma5 < *ma20 && *ma20 < *ma50) {
        return MaAlignment::Bearish;
    }
    // Partial alignment around the 20-period average
    if (price > *ma20 && *ma5 > *ma20) {
        return MaAlignment::Bullish;
    }
    if (price < *ma20 && *ma5 < *ma20) {
        return MaAlignment::Bearish;
    }
    return MaAlignment::Neutral;
}

bool TrendAnalyzer::volume_confirms(const std::vector<exchange::Candle>& hourly, double trend_strength) {
    if (hourly.size() < 12) {
        return false;
    }

    double older = 0;
    double recent = 0;
    for (size_t i = 0; i < 6; ++i) {
        older += hourly[i].volume;
        recent += hourly[hourly.size() - 6 + i].volume;
    }
    older /= 6;
    recent /= 6;
    if (older <= 0) {
        return false;
    }

    double change = (recent - older) / older;
    double strength = std::abs(trend_strength);
    if (strength > 0.3) {
        return change > 0.1; // strong trends need rising volume
    }
    if (strength > 0.1) {
        return change > -0.2;
    }
    return true;
}

TrendAnalysis TrendAnalyzer::analyze(const std::vector<exchange::Candle>& short_term,
                                     const std::vector<exchange::Candle>& medium_term,
                                     const std::vector<exchange::Candle>& long_term,
                                     const std::vector<exchange::Candle>& ma_series) const {
    TrendAnalysis out;
    out.short_term = timeframe_trend(short_term);
    out.medium_term = timeframe_trend(medium_term);
    out.long_term = timeframe_trend(long_term);

    const TimeframeTrend* tfs[] = {&out.short_term, &out.medium_term, &out.long_term};
    const double weights[] = {config_.short_term.weight, config_.medium_term.weight, config_.long_term.weight};

    double weighted = 0;
    double total_weight = 0;
    int valid = 0;
    int positive = 0;
    int negative = 0;
    for (int i = 0; i < 3; ++i) {
        if (!tfs[i]->valid)
            continue;
        ++valid;
        weighted += tfs[i]->momentum * weights[i];
        total_weight += weights[i];
        if (tfs[i]->momentum > config_.agreement_momentum)
            ++positive;
        else if (tfs[i]->momentum < -config_.agreement_momentum)
            ++negative;
    }

    out.regime.short_volatility = out.short_term.volatility;
    out.regime.medium_volatility = out.medium_term.volatility;
    out.regime.long_volatility = out.long_term.volatility;

    if (valid == 0 || total_weight <= 0) {
        out.category = RegimeCategory::Unknown;
        return out;
    }

    double strength = std::clamp(weighted / total_weight, -1.0, 1.0);
    out.ma_alignment = ma_alignment(exchange::closes_of(ma_series));
    out.volume_confirmed = volume_confirms(medium_term, strength);

    double confidence = 0.5;
    if (valid >= 2) {
        if (positive >= 2 || negative >= 2) {
            confidence += 0.3;
        } else if (positive + negative < valid) {
            confidence += 0.1;
        }
    }
    confidence += (out.ma_alignment == MaAlignment::Neutral) ? 0.05 : 0.15;
    if (out.volume_confirmed) {
        confidence += 0.05;
    }

    out.regime.known = true;
    out.regime.trend_strength = strength;
    out.regime.confidence = std::clamp(confidence, 0.0, 1.0);
    out.category = classify_regime(out.regime);
    return out;
}

std::vector<exchange::Candle> TrendAnalyzer::fetch(exchange::IMarketDataProvider& market, const std::string& pair,
                                                   uint32_t granularity_sec, uint32_t limit) const {
    try {
        return market.get_historical(pair, granularity_sec, limit);
    } catch (const std::exception& e) {
        LOGF_WARN(logger_, logging::LogCategory::Market, "trend fetch %s/%us failed: %s", pair.c_str(),
                  granularity_sec, e.what());
        return {};
    }
}

TrendAnalysis TrendAnalyzer::analyze(exchange::IMarketDataProvider& market, const std::string& pair) const {
    auto short_term = fetch(market, pair, config_.short_term.granularity_sec, config_.short_term.candles);
    auto long_term = fetch(market, pair, config_.long_term.granularity_sec, config_.long_term.candles);

    // One hourly request serves both the medium timeframe and the MA check
    uint32_t hourly_limit = std::max(config_.medium_term.candles, config_.ma_candles);
    auto hourly = fetch(market, pair, config_.medium_term.granularity_sec, hourly_limit);
    std::vector<exchange::Candle> medium_term = hourly;
    if (medium_term.size() > config_.medium_term.candles) {
        medium_term.erase(medium_term.begin(), medium_term.end() - config_.medium_term.candles);
    }

    TrendAnalysis analysis = analyze(short_term, medium_term, long_term, hourly);
    LOGF_DEBUG(logger_, logging::LogCategory::Market, "%s regime %s strength=%.3f conf=%.2f", pair.c_str(),
               regime_to_string(analysis.category), analysis.regime.trend_strength, analysis.regime.confidence);
    return analysis;
}

} // namespace strategy
} // namespace tradebot
