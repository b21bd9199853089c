#pragma once

/**
 * PositionLedger - FIFO cost-basis accounting per pair
 *
 * Invariants (MUST ALWAYS HOLD):
 *   quantity == sum(lot.quantity) >= 0
 *   total_pnl == realized_pnl + unrealized_pnl
 *
 * Buy fills open a lot at unit_cost = price + fee / quantity.
 * Sell fills consume lots oldest first:
 *   realized += consumed x (sell_price - lot.unit_cost)
 * and the sell fee comes off realized. A partially consumed lot keeps
 * its unit cost. Selling more than is held consumes what exists and
 * logs a warning. Each fill_id is applied once.
 *
 * Usage:
 *   PositionLedger ledger;
 *   ledger.record_fill({"f1", "BTC-USD", Side::Buy, 1.0, 10000, 0, ts});
 *   ledger.record_fill({"f2", "BTC-USD", Side::Sell, 0.5, 12000, 0, ts});
 *   ledger.summary("BTC-USD", 11000).realized_pnl;  // 1000
 */

#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tradebot {
namespace trading {

struct Fill {
    std::string fill_id;
    std::string pair;
    Side side = Side::Buy;
    double quantity = 0;
    double price = 0;
    double fee = 0;
    Timestamp timestamp = NO_TIMESTAMP;
};

struct Lot {
    double quantity = 0;
    double unit_cost = 0; // includes the buy fee per unit
    std::string fill_id;
    Timestamp purchase_date = NO_TIMESTAMP;
};

enum class FillResult : uint8_t {
    Applied = 0,
    Duplicate, // fill_id seen before, ignored
    Invalid    // non-positive quantity or price, ignored
};

inline const char* fill_result_to_string(FillResult r) {
    switch (r) {
    case FillResult::Applied:
        return "Applied";
    case FillResult::Duplicate:
        return "Duplicate";
    case FillResult::Invalid:
        return "Invalid";
    default:
        return "Unknown";
    }
}

struct FillOutcome {
    FillResult result = FillResult::Applied;
    double realized_pnl = 0;      // P&L realized by this fill (sells only)
    double consumed_quantity = 0; // sells: quantity taken from lots
    double oversold_quantity = 0; // sells: quantity beyond what was held
};

struct PositionSummary {
    std::string pair;
    double current_quantity = 0;
    double average_cost_basis = 0; // quantity-weighted unit cost of open lots
    double realized_pnl = 0;
    double unrealized_pnl = 0;
    double total_pnl = 0;
    double total_fees = 0;
    uint32_t buy_count = 0;
    uint32_t sell_count = 0;
    size_t open_lots = 0;
    std::optional<double> current_price;
};

class PositionLedger {
public:
    explicit PositionLedger(logging::AsyncLogger* logger = nullptr) : logger_(logger) {}

    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    FillOutcome record_fill(const Fill& fill);

    // Unrealized P&L is 0 when no current price is given
    PositionSummary summary(const std::string& pair, std::optional<double> current_price = std::nullopt) const;

    std::vector<Lot> lots(const std::string& pair) const;
    std::vector<std::string> pairs() const;
    double quantity(const std::string& pair) const;

private:
    struct PairBook {
        std::deque<Lot> lots;
        double realized_pnl = 0;
        double total_fees = 0;
        uint32_t buy_count = 0;
        uint32_t sell_count = 0;
    };

    logging::AsyncLogger* logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PairBook> books_;
    std::unordered_set<std::string> seen_fills_;

    double apply_sell(PairBook& book, const Fill& fill, FillOutcome& outcome);
};

} // namespace trading
} // namespace tradebot
