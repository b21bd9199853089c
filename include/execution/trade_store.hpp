#pragma once

#include "trade.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tradebot {
namespace execution {

/**
 * TradeStore - in-memory trade table
 *
 * The mutex only guards the container. Read-check-act sequences that
 * span several calls (pending check, then insert) are serialized per
 * bot by the executor's trade lock, not here.
 */
class TradeStore {
public:
    TradeStore() : next_id_(1) {}

    TradeStore(const TradeStore&) = delete;
    TradeStore& operator=(const TradeStore&) = delete;

    // Assigns and returns the new trade id
    TradeId insert(Trade trade);

    std::optional<Trade> get(TradeId id) const;

    bool has_pending(BotId bot) const;
    std::vector<Trade> pending() const;

    // filled_at of the bot's most recent filled trade, NO_TIMESTAMP if none
    Timestamp last_filled_at(BotId bot) const;

    // Non-failed trades created on the given UTC day
    uint32_t trade_count_on_day(BotId bot, uint64_t day) const;

    // Sum of realized P&L of trades filled on the given UTC day
    double realized_pnl_on_day(BotId bot, uint64_t day) const;

    bool set_order_id(TradeId id, const std::string& order_id);

    /**
     * Move a pending trade to a terminal status.
     * Returns false (and changes nothing) if the trade is missing or
     * already terminal, so each trade transitions at most once.
     * A filled_quantity of 0 means the whole requested size filled.
     */
    bool complete(TradeId id, Timestamp filled_at, double fill_price, double filled_quantity, double fee);
    bool fail(TradeId id, TradeStatus status, const std::string& error);

    bool set_realized_pnl(TradeId id, double pnl);

    std::vector<Trade> trades_for(BotId bot) const;
    std::vector<Trade> all() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    TradeId next_id_;
    std::unordered_map<TradeId, Trade> trades_;
};

} // namespace execution
} // namespace tradebot
