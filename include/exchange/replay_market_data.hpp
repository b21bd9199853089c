#pragma once

#include "market_data.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradebot {
namespace exchange {

/**
 * ReplayMarketData - serves recorded candles as if they were live
 *
 * Each pair holds a base-resolution candle series. The replay cursor
 * (milliseconds) hides every candle that opens after it. Requests for a
 * coarser granularity are answered by bucketing base candles on
 * open_time. The current price is the close of the last visible candle.
 */
class ReplayMarketData : public IMarketDataProvider {
public:
    ReplayMarketData() : cursor_ms_(0) {}

    void add_series(const std::string& pair, std::vector<Candle> candles) {
        std::sort(candles.begin(), candles.end(),
                  [](const Candle& a, const Candle& b) { return a.open_time < b.open_time; });
        std::unique_lock<std::shared_mutex> lock(mutex_);
        series_[pair] = std::move(candles);
    }

    void set_cursor_ms(uint64_t cursor_ms) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cursor_ms_ = cursor_ms;
    }

    uint64_t cursor_ms() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return cursor_ms_;
    }

    // Open times across all pairs, ascending and unique; the runner steps through these
    std::vector<uint64_t> timeline() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<uint64_t> times;
        for (const auto& [pair, candles] : series_) {
            for (const auto& c : candles) {
                times.push_back(c.open_time);
            }
        }
        std::sort(times.begin(), times.end());
        times.erase(std::unique(times.begin(), times.end()), times.end());
        return times;
    }

    std::vector<Candle> get_historical(const std::string& pair, uint32_t granularity_sec, uint32_t limit) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = series_.find(pair);
        if (it == series_.end() || limit == 0) {
            return {};
        }

        const uint64_t bucket_ms = static_cast<uint64_t>(std::max<uint32_t>(granularity_sec, 1)) * 1000;
        std::vector<Candle> out;

        for (const auto& c : it->second) {
            if (c.open_time > cursor_ms_)
                break;

            uint64_t bucket = c.open_time - (c.open_time % bucket_ms);
            if (out.empty() || out.back().open_time != bucket) {
                Candle agg = c;
                agg.open_time = bucket;
                out.push_back(agg);
            } else {
                Candle& agg = out.back();
                agg.high = std::max(agg.high, c.high);
                agg.low = std::min(agg.low, c.low);
                agg.close = c.close;
                agg.volume += c.volume;
            }
        }

        if (out.size() > limit) {
            out.erase(out.begin(), out.end() - limit);
        }
        return out;
    }

    std::optional<double> get_price(const std::string& pair) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = series_.find(pair);
        if (it == series_.end()) {
            return std::nullopt;
        }

        std::optional<double> price;
        for (const auto& c : it->second) {
            if (c.open_time > cursor_ms_)
                break;
            price = c.close;
        }
        return price;
    }

private:
    mutable std::shared_mutex mutex_;
    uint64_t cursor_ms_;
    std::unordered_map<std::string, std::vector<Candle>> series_;
};

} // namespace exchange
} // namespace tradebot
