#pragma once

#include "../exchange/market_data.hpp"
#include "../logging/async_logger.hpp"
#include "regime.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tradebot {
namespace strategy {

enum class MaAlignment : uint8_t { Neutral = 0, Bullish, Bearish };

inline const char* ma_alignment_to_string(MaAlignment a) {
    switch (a) {
    case MaAlignment::Bullish:
        return "BULLISH";
    case MaAlignment::Bearish:
        return "BEARISH";
    default:
        return "NEUTRAL";
    }
}

struct TimeframeSpec {
    uint32_t granularity_sec;
    uint32_t candles;
    double weight;
};

struct TrendAnalyzerConfig {
    TimeframeSpec short_term{300, 12, 0.3};   // 5 min x 12
    TimeframeSpec medium_term{3600, 24, 0.4}; // 1 hour x 24
    TimeframeSpec long_term{86400, 7, 0.3};   // 1 day x 7

    uint32_t ma_candles = 50; // hourly candles for the MA5/20/50 check
    size_t min_candles = 3;   // per timeframe, below this the timeframe is skipped
    double agreement_momentum = 0.1;
};

struct TimeframeTrend {
    bool valid = false;
    double momentum = 0;   // tanh(10 x change), [-1, 1]
    double volatility = 0; // fraction
    size_t data_points = 0;
};

struct TrendAnalysis {
    TimeframeTrend short_term;
    TimeframeTrend medium_term;
    TimeframeTrend long_term;
    MaAlignment ma_alignment = MaAlignment::Neutral;
    bool volume_confirmed = false;
    RegimeDescriptor regime;
    RegimeCategory category = RegimeCategory::Unknown;
};

/**
 * TrendAnalyzer - multi-timeframe regime detection
 *
 * trend_strength = weighted momentum over the timeframes that have data.
 * confidence starts at 0.5 and gains:
 *   +0.3 when two or more timeframes agree on direction (|m| > 0.1),
 *   +0.1 when at least one timeframe is flat instead,
 *   +0.15 for a bullish/bearish MA5/20/50 alignment, +0.05 for neutral,
 *   +0.05 when volume confirms the trend.
 * With no usable timeframe the regime stays Unknown.
 */
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(const TrendAnalyzerConfig& config = TrendAnalyzerConfig(),
                           logging::AsyncLogger* logger = nullptr);

    TrendAnalysis analyze(const std::vector<exchange::Candle>& short_term,
                          const std::vector<exchange::Candle>& medium_term,
                          const std::vector<exchange::Candle>& long_term,
                          const std::vector<exchange::Candle>& ma_series) const;

    // Fetches all timeframes from the provider. Provider failures count as missing data.
    TrendAnalysis analyze(exchange::IMarketDataProvider& market, const std::string& pair) const;

    static MaAlignment ma_alignment(const std::vector<double>& closes);
    static bool volume_confirms(const std::vector<exchange::Candle>& hourly, double trend_strength);

    const TrendAnalyzerConfig& config() const { return config_; }

private:
    TrendAnalyzerConfig config_;
    logging::AsyncLogger* logger_;

    TimeframeTrend timeframe_trend(const std::vector<exchange::Candle>& candles) const;
    std::vector<exchange::Candle> fetch(exchange::IMarketDataProvider& market, const std::string& pair,
                                        uint32_t granularity_sec, uint32_t limit) const;
};

} // namespace strategy
} // namespace tradebot
