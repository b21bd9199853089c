#pragma once

#include "signal.hpp"

#include <map>
#include <string>

namespace tradebot {
namespace strategy {

/**
 * Output of one indicator calculator.
 *
 * score in [-1, 1]: negative is buy pressure, positive is sell pressure.
 * confidence in [0, 1]. Calculators without enough history return
 * hold / score 0 / insufficient_data instead of failing.
 */
struct SignalResult {
    std::string name;
    double score = 0;
    TradeAction action = TradeAction::Hold;
    double confidence = 0;
    bool insufficient_data = false;
    std::map<std::string, double> metadata;

    static SignalResult insufficient(const std::string& name, size_t have, size_t need) {
        SignalResult r;
        r.name = name;
        r.insufficient_data = true;
        r.metadata["candles_available"] = static_cast<double>(have);
        r.metadata["candles_required"] = static_cast<double>(need);
        return r;
    }
};

} // namespace strategy
} // namespace tradebot
