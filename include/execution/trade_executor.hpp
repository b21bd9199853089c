#pragma once

#include "../config/defaults.hpp"
#include "../exchange/broker_client.hpp"
#include "../exchange/market_data.hpp"
#include "../logging/async_logger.hpp"
#include "../risk/safety_policy.hpp"
#include "../strategy/signal.hpp"
#include "../trading/position_ledger.hpp"
#include "../util/time_utils.hpp"
#include "bot_registry.hpp"
#include "trade.hpp"
#include "trade_store.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tradebot {
namespace execution {

// =============================================================================
// Executor Configuration
// =============================================================================

struct ExecutorConfig {
    std::chrono::milliseconds lock_timeout{config::timing::LOCK_TIMEOUT_MS};
    int stale_pending_minutes = config::timing::STALE_PENDING_MINUTES;
    int quantity_decimals = config::execution::QUANTITY_DECIMALS;
};

// =============================================================================
// Trade Executor
// =============================================================================

/**
 * TradeExecutor - exactly-once order submission per bot
 *
 * execute_trade checks, in order, each a distinct RejectReason with no
 * side effects:
 *   1. bot exists and is running
 *   -- per-bot trade lock, try_lock_for(lock_timeout) --
 *   2. safety limits (size, temperature, daily trades, daily loss)
 *   3. no pending trade for the bot
 *   4. cooldown since the bot's last filled trade
 * then, still under the lock: fetch price, write the pending row,
 * submit to the broker, store the order id. A broker failure marks the
 * row failed. The lock is released on every exit path.
 *
 * Order monitoring: apply_order_status moves a pending row to its
 * terminal status exactly once. Fills update the bot's position size
 * and the PositionLedger. poll_pending_orders asks the broker about
 * every pending row and alerts on rows pending longer than
 * stale_pending_minutes.
 */
class TradeExecutor {
public:
    using AlertCallback = std::function<void(const Trade& trade, const std::string& message)>;

    TradeExecutor(BotRegistry& registry, TradeStore& trades, trading::PositionLedger& ledger,
                  exchange::IMarketDataProvider& market, exchange::IBrokerClient& broker,
                  const risk::ISafetyPolicy& safety, const ExecutorConfig& config = ExecutorConfig(),
                  logging::AsyncLogger* logger = nullptr);

    TradeExecutor(const TradeExecutor&) = delete;
    TradeExecutor& operator=(const TradeExecutor&) = delete;

    void set_clock(util::ClockFn clock) { clock_ = std::move(clock); }
    void set_alert_callback(AlertCallback cb) { on_alert_ = std::move(cb); }

    ExecutionResult execute_trade(BotId bot, Side side, double size_usd, strategy::Temperature temperature,
                                  const std::string& signal_snapshot = "{}");

    // Returns true if the report moved the trade to a terminal status
    bool apply_order_status(TradeId trade_id, const exchange::OrderStatusReport& report);

    // Returns the number of trades that reached a terminal status
    size_t poll_pending_orders();

    static double round_quantity(double quantity, int decimals);

    const ExecutorConfig& config() const { return config_; }

private:
    BotRegistry& registry_;
    TradeStore& trades_;
    trading::PositionLedger& ledger_;
    exchange::IMarketDataProvider& market_;
    exchange::IBrokerClient& broker_;
    const risk::ISafetyPolicy& safety_;
    ExecutorConfig config_;
    logging::AsyncLogger* logger_;
    util::ClockFn clock_;
    AlertCallback on_alert_;

    std::mutex alerted_mutex_;
    std::unordered_set<TradeId> alerted_;

    ExecutionResult execute_locked(const config::BotConfig& bot, Side side, double size_usd,
                                   strategy::Temperature temperature, const std::string& signal_snapshot);
    void apply_fill(const Trade& trade);
    void check_stale(const Trade& trade, Timestamp now);
};

} // namespace execution
} // namespace tradebot
