#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace tradebot {

using Timestamp = uint64_t; // Wall-clock nanoseconds since Unix epoch, 0 = unset
using BotId = uint32_t;
using TradeId = uint64_t;
using Usd = double;

constexpr BotId INVALID_BOT_ID = 0;
constexpr TradeId INVALID_TRADE_ID = 0;
constexpr Timestamp NO_TIMESTAMP = 0;

// Base quantities below this are treated as zero (dust)
constexpr double QUANTITY_EPSILON = 1e-12;

enum class Side : uint8_t { Buy = 0, Sell = 1 };

inline const char* side_to_string(Side side) {
    switch (side) {
    case Side::Buy:
        return "buy";
    case Side::Sell:
        return "sell";
    default:
        return "unknown";
    }
}

inline bool string_to_side(const std::string& s, Side& out) {
    if (s == "buy" || s == "BUY") {
        out = Side::Buy;
        return true;
    }
    if (s == "sell" || s == "SELL") {
        out = Side::Sell;
        return true;
    }
    return false;
}

// Bot lifecycle status; only Running bots are evaluated and may trade
enum class BotStatus : uint8_t { Running = 0, Stopped, Error };

inline const char* bot_status_to_string(BotStatus status) {
    switch (status) {
    case BotStatus::Running:
        return "running";
    case BotStatus::Stopped:
        return "stopped";
    case BotStatus::Error:
        return "error";
    default:
        return "unknown";
    }
}

inline bool string_to_bot_status(const std::string& s, BotStatus& out) {
    if (s == "running" || s == "RUNNING") {
        out = BotStatus::Running;
    } else if (s == "stopped" || s == "STOPPED") {
        out = BotStatus::Stopped;
    } else if (s == "error" || s == "ERROR") {
        out = BotStatus::Error;
    } else {
        return false;
    }
    return true;
}

} // namespace tradebot
