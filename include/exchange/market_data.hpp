#pragma once

#include "../types.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradebot {
namespace exchange {

/**
 * OHLCV candle, prices in quote currency
 */
struct Candle {
    uint64_t open_time = 0; // milliseconds since epoch
    double open = 0;
    double high = 0;
    double low = 0;
    double close = 0;
    double volume = 0;
};

/**
 * Market data source consumed by the bot engine.
 *
 * get_historical returns candles in ascending time order and may return
 * fewer than `limit` (or none). get_price returns nullopt when no quote
 * is available. Implementations may throw std::runtime_error on transport
 * failures; callers treat that the same as missing data.
 */
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual std::vector<Candle> get_historical(const std::string& pair, uint32_t granularity_sec,
                                               uint32_t limit) = 0;
    virtual std::optional<double> get_price(const std::string& pair) = 0;
};

inline std::vector<double> closes_of(const std::vector<Candle>& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& c : candles) {
        out.push_back(c.close);
    }
    return out;
}

/**
 * Load candles from CSV file
 *
 * Format: open_time,open,high,low,close,volume
 * Header line is optional. Rows with fewer than 6 columns are skipped.
 */
inline std::vector<Candle> load_candles_csv(const std::string& filename) {
    std::vector<Candle> candles;
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::string line;
    bool first_line = true;

    while (std::getline(file, line)) {
        if (first_line && line.find("open_time") != std::string::npos) {
            first_line = false;
            continue;
        }
        first_line = false;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        std::stringstream ss(line);
        std::string token;
        std::vector<std::string> tokens;

        while (std::getline(ss, token, ',')) {
            tokens.push_back(token);
        }

        if (tokens.size() < 6)
            continue;

        Candle c;
        try {
            c.open_time = std::stoull(tokens[0]);
            c.open = std::stod(tokens[1]);
            c.high = std::stod(tokens[2]);
            c.low = std::stod(tokens[3]);
            c.close = std::stod(tokens[4]);
            c.volume = std::stod(tokens[5]);
        } catch (const std::exception&) {
            throw std::runtime_error("Malformed candle row in " + filename + ": " + line);
        }

        candles.push_back(c);
    }

    return candles;
}

/**
 * Save candles to CSV file
 */
inline void save_candles_csv(const std::string& filename, const std::vector<Candle>& candles) {
    std::ofstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << "open_time,open,high,low,close,volume\n";
    for (const auto& c : candles) {
        file << c.open_time << "," << c.open << "," << c.high << "," << c.low << "," << c.close << "," << c.volume
             << "\n";
    }
}

} // namespace exchange
} // namespace tradebot
