#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace tradebot {
namespace strategy {
namespace indicators {

/**
 * Technical indicators over close-price series
 *
 * Series are in ascending time order; the last element is the most
 * recent close. Functions that need more history than the series has
 * return nullopt (or an empty vector) instead of a partial value.
 *
 * - SMA: arithmetic mean of the window ending at `end`
 * - EMA: alpha = 2/(period+1), seeded with the first value
 * - RSI: rolling mean of gains/losses over the last `period` changes
 * - MACD: EMA(fast) - EMA(slow), signal = EMA(macd, signal_period)
 */

// Mean of values[end - period, end)
inline std::optional<double> sma(const std::vector<double>& values, size_t end, int period) {
    if (period <= 0 || end > values.size() || end < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    double sum = 0;
    for (size_t i = end - period; i < end; ++i) {
        sum += values[i];
    }
    return sum / period;
}

inline std::optional<double> sma(const std::vector<double>& values, int period) {
    return sma(values, values.size(), period);
}

inline std::vector<double> ema_series(const std::vector<double>& values, int period) {
    std::vector<double> out;
    if (values.empty() || period <= 0) {
        return out;
    }
    const double alpha = 2.0 / (period + 1);
    out.reserve(values.size());
    double ema = values.front();
    for (double v : values) {
        ema = alpha * v + (1.0 - alpha) * ema;
        out.push_back(ema);
    }
    return out;
}

/**
 * RSI in [0, 100]. Needs period+1 closes.
 * No losses and some gains gives 100; a flat window gives 50.
 */
inline std::optional<double> rsi(const std::vector<double>& closes, int period) {
    if (period <= 0 || closes.size() < static_cast<size_t>(period) + 1) {
        return std::nullopt;
    }
    double gains = 0;
    double losses = 0;
    for (size_t i = closes.size() - period; i < closes.size(); ++i) {
        double change = closes[i] - closes[i - 1];
        if (change > 0) {
            gains += change;
        } else {
            losses -= change;
        }
    }
    double avg_gain = gains / period;
    double avg_loss = losses / period;

    if (avg_loss == 0) {
        return avg_gain == 0 ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

struct MacdPoint {
    double macd = 0;
    double signal = 0;
    double histogram = 0;
};

// Full MACD series; empty if fewer than slow + signal closes
inline std::vector<MacdPoint> macd_series(const std::vector<double>& closes, int fast, int slow, int signal) {
    std::vector<MacdPoint> out;
    if (fast <= 0 || slow <= 0 || signal <= 0 || closes.size() < static_cast<size_t>(slow + signal)) {
        return out;
    }
    std::vector<double> fast_ema = ema_series(closes, fast);
    std::vector<double> slow_ema = ema_series(closes, slow);

    std::vector<double> macd(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        macd[i] = fast_ema[i] - slow_ema[i];
    }
    std::vector<double> signal_ema = ema_series(macd, signal);

    out.resize(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        out[i].macd = macd[i];
        out[i].signal = signal_ema[i];
        out[i].histogram = macd[i] - signal_ema[i];
    }
    return out;
}

// Population standard deviation of close-to-close returns (fraction, not percent)
inline double return_volatility(const std::vector<double>& closes) {
    if (closes.size() < 3) {
        return 0;
    }
    std::vector<double> returns;
    returns.reserve(closes.size() - 1);
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] > 0) {
            returns.push_back((closes[i] - closes[i - 1]) / closes[i - 1]);
        }
    }
    if (returns.size() < 2) {
        return 0;
    }
    double mean = 0;
    for (double r : returns)
        mean += r;
    mean /= returns.size();

    double var = 0;
    for (double r : returns)
        var += (r - mean) * (r - mean);
    return std::sqrt(var / returns.size());
}

// tanh(10 x fractional change from first to last close), in [-1, 1]
inline double momentum(const std::vector<double>& closes) {
    if (closes.size() < 2 || closes.front() <= 0) {
        return 0;
    }
    double change = (closes.back() - closes.front()) / closes.front();
    return std::tanh(change * 10.0);
}

} // namespace indicators
} // namespace strategy
} // namespace tradebot
