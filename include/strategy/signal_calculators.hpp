#pragma once

#include "../config/bot_config.hpp"
#include "signal_result.hpp"

#include <cstddef>
#include <vector>

namespace tradebot {
namespace strategy {

/**
 * Reference indicator calculators.
 *
 * Each takes ascending close prices and returns a SignalResult whose
 * sign agrees with the action resolver (negative = buy).
 *
 * - RSI: buy at or below oversold, sell at or above overbought
 * - MA crossover: +-0.8 on a fresh cross, otherwise -tanh(10 x separation)
 * - MACD: +-0.8 on a fresh signal-line cross, otherwise -tanh(1000 x histogram / price)
 */

// Minimum closes the indicator needs
size_t required_closes(const config::IndicatorConfig& indicator);

SignalResult calculate_rsi(const std::string& name, const config::RsiConfig& cfg, const std::vector<double>& closes);
SignalResult calculate_ma_crossover(const std::string& name, const config::MovingAverageConfig& cfg,
                                    const std::vector<double>& closes);
SignalResult calculate_macd(const std::string& name, const config::MacdConfig& cfg,
                            const std::vector<double>& closes);

// Dispatches on the indicator's parameter type
SignalResult calculate_signal(const config::IndicatorConfig& indicator, const std::vector<double>& closes);

} // namespace strategy
} // namespace tradebot
