/**
 * Test TradeExecutor - pre-trade checks, order submission and
 * order monitoring
 *
 * Rejections leave no Trade row (except broker failures, which leave a
 * failed row). Fills update the bot position and the ledger exactly once.
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "../include/execution/trade_executor.hpp"
#include "mocks.hpp"

using namespace tradebot;
using namespace tradebot::execution;
using strategy::Temperature;

// Test framework macros
#define TEST(name) void name()

#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        try {                                                                                                          \
            name();                                                                                                    \
            std::cout << "PASSED\n";                                                                                   \
        } catch (...) {                                                                                                \
            std::cout << "FAILED (exception)\n";                                                                       \
            return 1;                                                                                                  \
        }                                                                                                              \
    } while (0)

#define ASSERT_EQ(a, b)                                                                                                \
    do {                                                                                                               \
        if ((a) != (b)) {                                                                                              \
            std::cerr << "\nFAIL: " << #a << " (" << (a) << ") != " << #b << " (" << (b) << ")\n";                     \
            assert(false);                                                                                             \
        }                                                                                                              \
    } while (0)

#define ASSERT_NEAR(a, b, tol)                                                                                         \
    do {                                                                                                               \
        if (std::abs((a) - (b)) > (tol)) {                                                                             \
            std::cerr << "\nFAIL: " << #a << " (" << (a) << ") != " << #b << " (" << (b) << ") within " << (tol)       \
                      << "\n";                                                                                         \
            assert(false);                                                                                             \
        }                                                                                                              \
    } while (0)

#define ASSERT_TRUE(expr)                                                                                              \
    do {                                                                                                               \
        if (!(expr)) {                                                                                                 \
            std::cerr << "\nFAIL: " << #expr << " is false\n";                                                         \
            assert(false);                                                                                             \
        }                                                                                                              \
    } while (0)


namespace {

config::BotConfig make_bot(BotId id, const std::string& pair = "BTC-USD") {
    config::BotConfig bot;
    bot.id = id;
    bot.name = "bot" + std::to_string(id);
    bot.pair = pair;
    bot.cooldown_minutes = 15;
    return bot;
}

struct Fixture {
    BotRegistry registry;
    TradeStore trades;
    trading::PositionLedger ledger;
    test::StaticMarketData market;
    test::MockBroker broker;
    risk::StaticSafetyPolicy safety;
    test::ManualClock clock;
    TradeExecutor executor;

    explicit Fixture(const ExecutorConfig& cfg = ExecutorConfig())
        : executor(registry, trades, ledger, market, broker, safety, cfg) {
        executor.set_clock(clock.fn());
        market.set_price("BTC-USD", 50000.0);
        market.set_price("ETH-USD", 2000.0);
    }

    void add_bot(config::BotConfig bot) { registry.add(bot); }

    void set_limits(uint32_t max_trades, double max_loss) {
        risk::SafetyLimits limits;
        limits.max_daily_trades = max_trades;
        limits.max_daily_loss_usd = max_loss;
        safety.set_limits(limits);
    }

    double position(BotId bot) { return registry.runtime(bot)->current_position_size; }
};

} // namespace

// =============================================================================
// Happy path
// =============================================================================

TEST(buy_fills_immediately) {
    Fixture fx;
    fx.add_bot(make_bot(1));

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot, "{\"score\":-0.5}");
    ASSERT_TRUE(r.success);
    ASSERT_EQ(r.trade_id, 1u);
    ASSERT_EQ(r.order_id, std::string("order-1"));
    ASSERT_NEAR(r.base_size, 0.0002, 1e-12);
    ASSERT_NEAR(fx.broker.last_quantity(), 0.0002, 1e-12);

    auto t = fx.trades.get(r.trade_id);
    ASSERT_TRUE(t->status == TradeStatus::Completed);
    ASSERT_EQ(t->filled_at, fx.clock.now.load());
    ASSERT_EQ(t->signal_scores, std::string("{\"score\":-0.5}"));
    ASSERT_NEAR(fx.position(1), 10.0, 1e-12);
    ASSERT_NEAR(fx.ledger.quantity("BTC-USD"), 0.0002, 1e-12);
}

TEST(quantity_rounded_to_decimals) {
    ASSERT_NEAR(TradeExecutor::round_quantity(0.123456789, 8), 0.12345679, 1e-15);
    ASSERT_NEAR(TradeExecutor::round_quantity(10.0 / 3.0, 2), 3.33, 1e-12);
}

// =============================================================================
// Rejections
// =============================================================================

TEST(unknown_bot_rejected) {
    Fixture fx;
    auto r = fx.executor.execute_trade(99, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(!r.success);
    ASSERT_TRUE(r.reason == RejectReason::BotNotFound);
    ASSERT_TRUE(r.error_kind == ErrorKind::Validation);
    ASSERT_EQ(fx.trades.size(), 0u);
}

TEST(stopped_bot_rejected) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.registry.set_status(1, BotStatus::Stopped);

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::BotNotTradeable);
    ASSERT_EQ(fx.broker.place_calls(), 0);
}

TEST(size_limits) {
    Fixture fx;
    fx.add_bot(make_bot(1));

    auto r = fx.executor.execute_trade(1, Side::Buy, 4.99, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::SizeBelowMinimum);
    ASSERT_TRUE(r.error_kind == ErrorKind::SafetyRejection);

    r = fx.executor.execute_trade(1, Side::Buy, 25.01, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::SizeAboveMaximum);

    r = fx.executor.execute_trade(1, Side::Buy, std::numeric_limits<double>::quiet_NaN(), Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::InvalidSize);

    r = fx.executor.execute_trade(1, Side::Buy, 25.0, Temperature::Hot);
    ASSERT_TRUE(r.success);
    ASSERT_EQ(fx.trades.size(), 1u);
}

TEST(temperature_gate_uses_stricter_minimum) {
    Fixture fx;
    auto bot = make_bot(1);
    bot.min_temperature_to_trade = Temperature::Cool;
    fx.add_bot(bot);

    // Policy minimum (WARM) is stricter than the bot's COOL
    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Cool);
    ASSERT_TRUE(r.reason == RejectReason::TemperatureTooLow);

    risk::SafetyLimits limits;
    limits.min_temperature = Temperature::Hot;
    fx.safety.set_limits(limits);
    r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Warm);
    ASSERT_TRUE(r.reason == RejectReason::TemperatureTooLow);

    r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.success);
}

TEST(daily_trade_limit_per_bot) {
    Fixture fx;
    fx.set_limits(2, 100.0);
    auto bot = make_bot(1);
    bot.cooldown_minutes = 0;
    fx.add_bot(bot);
    auto other = make_bot(2);
    other.cooldown_minutes = 0;
    fx.add_bot(other);

    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::DailyTradeLimit);

    // Another bot has its own count
    ASSERT_TRUE(fx.executor.execute_trade(2, Side::Buy, 10.0, Temperature::Hot).success);

    // Next UTC day resets the count
    fx.clock.advance_minutes(24 * 60);
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
}

TEST(failed_trades_do_not_count_toward_daily_limit) {
    Fixture fx;
    fx.set_limits(1, 100.0);
    fx.add_bot(make_bot(1));

    fx.broker.fail_next_order();
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).reason == RejectReason::BrokerError);
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
}

TEST(daily_loss_limit) {
    Fixture fx;
    fx.set_limits(5, 1.0);
    auto bot = make_bot(1);
    bot.cooldown_minutes = 0;
    fx.add_bot(bot);

    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 20.0, Temperature::Hot).success);
    fx.market.set_price("BTC-USD", 40000.0);
    auto sell = fx.executor.execute_trade(1, Side::Sell, 16.0, Temperature::Hot);
    ASSERT_TRUE(sell.success);
    // 0.0004 x (40000 - 50000)
    ASSERT_NEAR(fx.trades.get(sell.trade_id)->realized_pnl, -4.0, 1e-9);

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::DailyLossLimit);
}

TEST(pending_order_blocks_new_trade) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);

    auto first = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(fx.trades.get(first.trade_id)->status == TradeStatus::Pending);
    ASSERT_NEAR(fx.position(1), 0.0, 1e-12);

    auto second = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(second.reason == RejectReason::PendingOrderExists);
    ASSERT_EQ(fx.broker.place_calls(), 1);
    ASSERT_EQ(fx.trades.size(), 1u);
}

TEST(cooldown_counts_from_fill_time) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.success);

    // Fill confirmed 20 minutes after submission
    fx.clock.advance_minutes(20);
    exchange::OrderStatusReport filled;
    filled.state = exchange::OrderState::Filled;
    filled.fill_price = 50100.0;
    filled.filled_quantity = 0.0002;
    fx.broker.set_status(r.order_id, filled);
    ASSERT_EQ(fx.executor.poll_pending_orders(), 1u);
    ASSERT_NEAR(fx.trades.get(r.trade_id)->price, 50100.0, 1e-9);

    // 20 minutes after creation but only 10 after the fill
    fx.clock.advance_minutes(10);
    auto blocked = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(blocked.reason == RejectReason::CooldownActive);
    ASSERT_TRUE(blocked.error.find("cooldown active for bot 1") != std::string::npos);

    // Exactly at the window boundary still blocked
    fx.clock.advance_minutes(5);
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).reason ==
                RejectReason::CooldownActive);

    fx.clock.advance_seconds(1);
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
}

TEST(unfilled_trades_do_not_start_cooldown) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    exchange::OrderStatusReport cancelled;
    cancelled.state = exchange::OrderState::Cancelled;
    cancelled.error = "expired";
    fx.broker.set_status(r.order_id, cancelled);
    ASSERT_EQ(fx.executor.poll_pending_orders(), 1u);

    auto t = fx.trades.get(r.trade_id);
    ASSERT_TRUE(t->status == TradeStatus::Cancelled);
    ASSERT_EQ(t->filled_at, NO_TIMESTAMP);
    ASSERT_NEAR(fx.position(1), 0.0, 1e-12);

    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
}

TEST(price_unavailable_leaves_no_row) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.market.clear_price("BTC-USD");

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::PriceUnavailable);
    ASSERT_TRUE(r.error_kind == ErrorKind::ExternalApi);

    fx.market.set_throw(true);
    r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::PriceUnavailable);
    ASSERT_EQ(fx.trades.size(), 0u);
    ASSERT_EQ(fx.broker.place_calls(), 0);
}

TEST(quantity_rounding_to_zero_rejected) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.market.set_price("BTC-USD", 1e12);

    auto r = fx.executor.execute_trade(1, Side::Buy, 5.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::InvalidSize);
    ASSERT_EQ(fx.trades.size(), 0u);
}

// =============================================================================
// Broker failures
// =============================================================================

TEST(broker_error_marks_trade_failed) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.fail_next_order("insufficient funds");

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(!r.success);
    ASSERT_TRUE(r.reason == RejectReason::BrokerError);
    ASSERT_TRUE(r.error_kind == ErrorKind::ExternalApi);
    ASSERT_TRUE(r.trade_id != INVALID_TRADE_ID);

    auto t = fx.trades.get(r.trade_id);
    ASSERT_TRUE(t->status == TradeStatus::Failed);
    ASSERT_EQ(t->error, std::string("insufficient funds"));
    ASSERT_NEAR(fx.position(1), 0.0, 1e-12);
    ASSERT_TRUE(fx.ledger.pairs().empty());

    // No pending row and no fill: the bot may retry immediately
    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
}

TEST(broker_exception_marks_trade_failed) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.throw_next_order();

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    ASSERT_TRUE(r.reason == RejectReason::BrokerError);
    ASSERT_TRUE(fx.trades.get(r.trade_id)->status == TradeStatus::Failed);
    ASSERT_TRUE(fx.trades.get(r.trade_id)->error.find("connection reset") != std::string::npos);
    ASSERT_TRUE(!fx.trades.has_pending(1));
}

// =============================================================================
// Order monitoring
// =============================================================================

TEST(sell_floors_position_at_zero) {
    Fixture fx;
    auto bot = make_bot(1);
    bot.cooldown_minutes = 0;
    fx.add_bot(bot);

    ASSERT_TRUE(fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot).success);
    fx.market.set_price("BTC-USD", 55000.0);
    auto sell = fx.executor.execute_trade(1, Side::Sell, 20.0, Temperature::Hot);
    ASSERT_TRUE(sell.success);
    ASSERT_NEAR(fx.position(1), 0.0, 1e-12);
    ASSERT_NEAR(fx.ledger.quantity("BTC-USD"), 0.0, 1e-12);
    // 0.0002 held x 5000
    ASSERT_NEAR(fx.trades.get(sell.trade_id)->realized_pnl, 1.0, 1e-9);
}

TEST(terminal_transition_applied_once) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);
    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);

    exchange::OrderStatusReport filled;
    filled.state = exchange::OrderState::Filled;
    filled.filled_quantity = 0.0002;
    ASSERT_TRUE(fx.executor.apply_order_status(r.trade_id, filled));
    ASSERT_TRUE(!fx.executor.apply_order_status(r.trade_id, filled));

    exchange::OrderStatusReport cancelled;
    cancelled.state = exchange::OrderState::Cancelled;
    ASSERT_TRUE(!fx.executor.apply_order_status(r.trade_id, cancelled));

    ASSERT_TRUE(fx.trades.get(r.trade_id)->status == TradeStatus::Completed);
    ASSERT_NEAR(fx.position(1), 10.0, 1e-12);
    ASSERT_NEAR(fx.ledger.quantity("BTC-USD"), 0.0002, 1e-12);
    ASSERT_EQ(fx.executor.poll_pending_orders(), 0u);
}

TEST(partial_fill_updates_position_by_filled_amount) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);

    // $20 at 50,000 = 0.0004 BTC requested, a quarter of it fills
    auto r = fx.executor.execute_trade(1, Side::Buy, 20.0, Temperature::Hot);
    ASSERT_TRUE(r.success);
    exchange::OrderStatusReport partial;
    partial.state = exchange::OrderState::Filled;
    partial.filled_quantity = 0.0001;
    ASSERT_TRUE(fx.executor.apply_order_status(r.trade_id, partial));

    auto t = fx.trades.get(r.trade_id);
    ASSERT_NEAR(t->filled_quantity, 0.0001, 1e-12);
    ASSERT_NEAR(t->size, 0.0004, 1e-12);
    ASSERT_NEAR(fx.ledger.quantity("BTC-USD"), 0.0001, 1e-12);
    ASSERT_NEAR(fx.position(1), 5.0, 1e-9);

    // Selling the held $5 leaves bot and ledger flat together
    fx.clock.advance_minutes(16);
    fx.broker.set_fill_immediately(true);
    auto sell = fx.executor.execute_trade(1, Side::Sell, 5.0, Temperature::Hot);
    ASSERT_TRUE(sell.success);
    ASSERT_NEAR(fx.position(1), 0.0, 1e-9);
    ASSERT_NEAR(fx.ledger.quantity("BTC-USD"), 0.0, 1e-12);
}

TEST(non_terminal_report_ignored) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);
    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);

    exchange::OrderStatusReport pending;
    pending.state = exchange::OrderState::Pending;
    ASSERT_TRUE(!fx.executor.apply_order_status(r.trade_id, pending));
    ASSERT_TRUE(!fx.executor.apply_order_status(12345, pending));
    ASSERT_TRUE(fx.trades.has_pending(1));
}

TEST(stale_pending_alert_fires_once) {
    Fixture fx;
    fx.add_bot(make_bot(1));
    fx.broker.set_fill_immediately(false);

    int alerts = 0;
    TradeId alerted_trade = INVALID_TRADE_ID;
    fx.executor.set_alert_callback([&](const Trade& trade, const std::string&) {
        ++alerts;
        alerted_trade = trade.id;
    });

    auto r = fx.executor.execute_trade(1, Side::Buy, 10.0, Temperature::Hot);
    fx.clock.advance_minutes(5);
    fx.executor.poll_pending_orders();
    ASSERT_EQ(alerts, 0);

    fx.clock.advance_minutes(6);
    ASSERT_EQ(fx.executor.poll_pending_orders(), 0u);
    ASSERT_EQ(alerts, 1);
    ASSERT_EQ(alerted_trade, r.trade_id);

    fx.clock.advance_minutes(10);
    fx.executor.poll_pending_orders();
    ASSERT_EQ(alerts, 1);
    ASSERT_TRUE(fx.trades.get(r.trade_id)->status == TradeStatus::Pending);
    ASSERT_EQ(fx.broker.status_calls(), 3);
}

int main() {
    std::cout << "\n=== Trade Executor Tests ===\n\n";

    std::cout << "--- Happy Path ---\n";
    RUN_TEST(buy_fills_immediately);
    RUN_TEST(quantity_rounded_to_decimals);

    std::cout << "\n--- Rejections ---\n";
    RUN_TEST(unknown_bot_rejected);
    RUN_TEST(stopped_bot_rejected);
    RUN_TEST(size_limits);
    RUN_TEST(temperature_gate_uses_stricter_minimum);
    RUN_TEST(daily_trade_limit_per_bot);
    RUN_TEST(failed_trades_do_not_count_toward_daily_limit);
    RUN_TEST(daily_loss_limit);
    RUN_TEST(pending_order_blocks_new_trade);
    RUN_TEST(cooldown_counts_from_fill_time);
    RUN_TEST(unfilled_trades_do_not_start_cooldown);
    RUN_TEST(price_unavailable_leaves_no_row);
    RUN_TEST(quantity_rounding_to_zero_rejected);

    std::cout << "\n--- Broker Failures ---\n";
    RUN_TEST(broker_error_marks_trade_failed);
    RUN_TEST(broker_exception_marks_trade_failed);

    std::cout << "\n--- Order Monitoring ---\n";
    RUN_TEST(sell_floors_position_at_zero);
    RUN_TEST(terminal_transition_applied_once);
    RUN_TEST(partial_fill_updates_position_by_filled_amount);
    RUN_TEST(non_terminal_report_ignored);
    RUN_TEST(stale_pending_alert_fires_once);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
