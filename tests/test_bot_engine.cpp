/**
 * Test BotEngine - full evaluation cycle
 *
 *   candles -> aggregate -> confirm -> size -> execute -> ledger
 *
 * Regime analysis is disabled except where a test needs it, so sizing
 * is base x confidence multiplier.
 */

#include <cassert>
#include <cmath>
#include <iostream>

#include <nlohmann/json.hpp>

#include "../include/bot_engine.hpp"
#include "../include/exchange/paper_broker.hpp"
#include "../include/exchange/replay_market_data.hpp"
#include "../include/strategy/evaluation_json.hpp"
#include "mocks.hpp"

using namespace tradebot;
using strategy::Temperature;
using strategy::TradeAction;

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

config::BotConfig rsi_bot(BotId id, const std::string& pair, int confirmation_minutes = 5) {
    config::BotConfig bot;
    bot.id = id;
    bot.name = "rsi-" + std::to_string(id);
    bot.pair = pair;
    bot.confirmation_minutes = confirmation_minutes;
    config::IndicatorConfig rsi;
    rsi.name = "rsi";
    rsi.weight = 1.0;
    rsi.params = config::RsiConfig{};
    bot.indicators.push_back(rsi);
    return bot;
}

EngineConfig no_regime() {
    EngineConfig cfg;
    cfg.analyze_regime = false;
    return cfg;
}

struct Fixture {
    test::StaticMarketData market;
    test::MockBroker broker;
    risk::StaticSafetyPolicy safety;
    test::ManualClock clock;
    BotEngine engine;

    explicit Fixture(const EngineConfig& cfg = no_regime()) : engine(market, broker, safety, cfg) {
        engine.set_clock(clock.fn());
        // Falling BTC (RSI 0, buy), rising ETH (RSI 100, sell)
        market.set_candles("BTC-USD", test::make_candles(test::linear_closes(200, 100, 40)));
        market.set_price("BTC-USD", 100.0);
        market.set_candles("ETH-USD", test::make_candles(test::linear_closes(100, 200, 40)));
        market.set_price("ETH-USD", 200.0);
    }
};

} // namespace

// =============================================================================
// Cycle
// =============================================================================

TEST(buy_after_confirmation) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(1, "BTC-USD"));

    CycleResult c1 = fx.engine.run_cycle(1);
    ASSERT_TRUE(c1.evaluated);
    ASSERT_TRUE(c1.evaluation.action == TradeAction::Buy);
    ASSERT_TRUE(c1.evaluation.temperature == Temperature::Hot);
    ASSERT_TRUE(!c1.trade_attempted);
    ASSERT_EQ(c1.skipped, std::string("awaiting confirmation"));
    ASSERT_EQ(fx.engine.trades().size(), 0u);

    fx.clock.advance_minutes(5);
    CycleResult c2 = fx.engine.run_cycle(1);
    ASSERT_TRUE(c2.evaluation.confirmation.is_confirmed);
    ASSERT_TRUE(c2.trade_attempted);
    ASSERT_TRUE(c2.execution.success);
    // base 10 x confidence multiplier 1.1
    ASSERT_NEAR(c2.evaluation.sizing.final_size_usd, 11.0, 1e-9);
    ASSERT_NEAR(c2.execution.base_size, 0.11, 1e-12);

    auto trade = fx.engine.trades().get(c2.execution.trade_id);
    ASSERT_TRUE(trade->status == execution::TradeStatus::Completed);
    auto snapshot = nlohmann::json::parse(trade->signal_scores);
    ASSERT_NEAR(snapshot["overall_score"].get<double>(), -1.0, 1e-9);
    ASSERT_TRUE(snapshot["signals"].contains("rsi"));

    ASSERT_NEAR(fx.engine.registry().runtime(1)->current_position_size, 11.0, 1e-9);
    auto pos = fx.engine.get_position_summary("BTC-USD");
    ASSERT_NEAR(pos.current_quantity, 0.11, 1e-12);
    ASSERT_NEAR(pos.average_cost_basis, 100.0, 1e-9);
    ASSERT_NEAR(pos.unrealized_pnl, 0.0, 1e-9);

    // Still confirmed a minute later, but inside the cooldown
    fx.clock.advance_minutes(1);
    CycleResult c3 = fx.engine.run_cycle(1);
    ASSERT_TRUE(c3.trade_attempted);
    ASSERT_TRUE(c3.execution.reason == RejectReason::CooldownActive);
    ASSERT_EQ(fx.engine.trades().size(), 1u);
}

TEST(sell_without_position_skipped) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(2, "ETH-USD", 0));

    CycleResult c = fx.engine.run_cycle(2);
    ASSERT_TRUE(c.evaluation.action == TradeAction::Sell);
    ASSERT_TRUE(c.evaluation.confirmation.is_confirmed);
    ASSERT_TRUE(!c.trade_attempted);
    ASSERT_EQ(c.skipped, std::string("no position to sell"));
}

TEST(sell_capped_at_held_position) {
    Fixture fx;
    auto bot = rsi_bot(3, "BTC-USD", 0);
    bot.cooldown_minutes = 0;
    fx.engine.add_bot(bot);

    ASSERT_TRUE(fx.engine.run_cycle(3).execution.success);
    ASSERT_NEAR(fx.engine.registry().runtime(3)->current_position_size, 11.0, 1e-9);

    // Prices recover: RSI flips to sell
    fx.market.set_candles("BTC-USD", test::make_candles(test::linear_closes(100, 200, 40)));
    fx.market.set_price("BTC-USD", 200.0);
    fx.clock.advance_minutes(1);

    CycleResult c = fx.engine.run_cycle(3);
    ASSERT_TRUE(c.evaluation.action == TradeAction::Sell);
    ASSERT_TRUE(c.execution.success);
    ASSERT_TRUE(fx.broker.last_side() == Side::Sell);
    ASSERT_NEAR(fx.broker.last_quantity(), 0.055, 1e-12);
    ASSERT_NEAR(fx.engine.registry().runtime(3)->current_position_size, 0.0, 1e-9);
    ASSERT_NEAR(fx.engine.trades().get(c.execution.trade_id)->realized_pnl, 5.5, 1e-9);
}

TEST(hold_and_errors_skip_trading) {
    Fixture fx;
    auto flat = rsi_bot(4, "SOL-USD", 0);
    fx.market.set_candles("SOL-USD", test::make_candles(std::vector<double>(40, 20.0)));
    fx.engine.add_bot(flat);

    auto broken = rsi_bot(5, "BTC-USD", 0);
    broken.config_error = "unknown indicator type 'stochastic'";
    broken.indicators.clear();
    fx.engine.add_bot(broken);

    CycleResult c4 = fx.engine.run_cycle(4);
    ASSERT_TRUE(c4.evaluation.action == TradeAction::Hold);
    ASSERT_EQ(c4.skipped, std::string("hold"));

    CycleResult c5 = fx.engine.run_cycle(5);
    ASSERT_TRUE(c5.evaluation.has_error());
    ASSERT_TRUE(c5.skipped.find("invalid signal configuration") != std::string::npos);
    ASSERT_EQ(fx.broker.place_calls(), 0);
}

TEST(stopped_and_unknown_bots) {
    Fixture fx;
    auto bot = rsi_bot(6, "BTC-USD");
    bot.status = BotStatus::Stopped;
    fx.engine.add_bot(bot);

    CycleResult c = fx.engine.run_cycle(6);
    ASSERT_TRUE(!c.evaluated);
    ASSERT_EQ(c.skipped, std::string("bot is stopped"));

    c = fx.engine.run_cycle(77);
    ASSERT_EQ(c.skipped, std::string("bot not found"));
}

TEST(market_data_failure_holds) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(1, "BTC-USD", 0));
    fx.market.set_throw(true);

    CycleResult c = fx.engine.run_cycle(1);
    ASSERT_TRUE(c.evaluated);
    ASSERT_TRUE(c.evaluation.action == TradeAction::Hold);
    ASSERT_TRUE(c.evaluation.signals[0].insufficient_data);
    ASSERT_TRUE(!c.trade_attempted);
}

TEST(duplicate_bot_rejected) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(1, "BTC-USD"));
    bool thrown = false;
    try {
        fx.engine.add_bot(rsi_bot(1, "ETH-USD"));
    } catch (const ValidationError&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

// =============================================================================
// Queries
// =============================================================================

TEST(history_newest_first) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(1, "BTC-USD"));
    for (int i = 0; i < 3; ++i) {
        fx.engine.run_cycle(1);
        fx.clock.advance_minutes(1);
    }

    auto all = fx.engine.history(1, 10);
    ASSERT_EQ(all.size(), 3u);
    ASSERT_TRUE(all[0].timestamp > all[1].timestamp);
    ASSERT_TRUE(all[1].timestamp > all[2].timestamp);
    ASSERT_EQ(fx.engine.history(1, 2).size(), 2u);
    ASSERT_TRUE(fx.engine.history(2, 10).empty());
}

TEST(temperature_and_confirmation_queries) {
    Fixture fx;
    fx.engine.add_bot(rsi_bot(1, "BTC-USD"));

    ASSERT_TRUE(!fx.engine.temperature_report(1).available);

    fx.engine.run_cycle(1);
    auto report = fx.engine.temperature_report(1);
    ASSERT_TRUE(report.available);
    ASSERT_EQ(report.pair, std::string("BTC-USD"));
    ASSERT_NEAR(report.score, -1.0, 1e-9);
    ASSERT_TRUE(report.temperature == Temperature::Hot);
    ASSERT_TRUE(report.action == TradeAction::Buy);
    ASSERT_TRUE(report.distance.in_buy_zone);
    ASSERT_EQ(report.evaluated_at, fx.clock.now.load());

    fx.clock.advance_minutes(2);
    auto status = fx.engine.get_confirmation_status(1);
    ASSERT_TRUE(status.state == strategy::ConfirmationState::Confirming);
    ASSERT_NEAR(status.progress, 0.4, 1e-9);
    ASSERT_NEAR(status.time_remaining_minutes, 3.0, 1e-9);

    auto rt = fx.engine.registry().runtime(1);
    ASSERT_NEAR(rt->current_combined_score, -1.0, 1e-9);
}

TEST(evaluate_with_regime_scales_size) {
    Fixture fx;
    auto bot = rsi_bot(1, "BTC-USD");
    fx.engine.add_bot(bot);

    strategy::RegimeDescriptor strong;
    strong.known = true;
    strong.trend_strength = -0.9;
    strong.confidence = 0.9;
    strong.medium_volatility = 0.005;

    auto result = fx.engine.evaluate(bot, test::make_candles(test::linear_closes(200, 100, 40)), strong);
    ASSERT_TRUE(result.sizing.regime == strategy::RegimeCategory::StrongTrending);
    // 10 x 1.5 x 1.2 x 1.1
    ASSERT_NEAR(result.sizing.final_size_usd, 19.8, 1e-9);

    auto j = nlohmann::json(result);
    ASSERT_EQ(j["sizing"]["regime"].get<std::string>(), std::string("STRONG_TRENDING"));
    ASSERT_EQ(j["confirmation"]["state"].get<std::string>(), std::string("confirming"));
}

TEST(regime_analysis_from_market_data) {
    Fixture fx(EngineConfig{});
    fx.engine.add_bot(rsi_bot(1, "BTC-USD"));
    CycleResult c = fx.engine.run_cycle(1);
    ASSERT_TRUE(c.evaluation.regime.known);
    ASSERT_TRUE(c.evaluation.regime.trend_strength < 0);
    ASSERT_TRUE(c.evaluation.sizing.final_size_usd >= 5.0 && c.evaluation.sizing.final_size_usd <= 25.0);
}

// =============================================================================
// Concurrency and replay
// =============================================================================

TEST(run_all_evaluates_each_bot) {
    Fixture fx;
    for (BotId id = 1; id <= 4; ++id) {
        fx.engine.add_bot(rsi_bot(id, id % 2 ? "BTC-USD" : "ETH-USD", 0));
    }
    auto results = fx.engine.run_all();
    ASSERT_EQ(results.size(), 4u);
    for (size_t i = 0; i < results.size(); ++i) {
        ASSERT_EQ(results[i].bot_id, static_cast<BotId>(i + 1));
        ASSERT_TRUE(results[i].evaluated);
    }
    // Two buy bots trade; the sell bots have nothing to sell
    ASSERT_EQ(fx.engine.trades().size(), 2u);
}

TEST(replay_with_paper_broker) {
    exchange::ReplayMarketData market;
    std::vector<double> closes = test::linear_closes(200, 100, 30);
    auto up = test::linear_closes(100, 150, 30);
    closes.insert(closes.end(), up.begin(), up.end());
    market.add_series("BTC-USD", test::make_candles(closes));

    exchange::PaperBroker broker(market);
    risk::StaticSafetyPolicy safety;
    BotEngine engine(market, broker, safety, no_regime());

    auto bot = rsi_bot(1, "BTC-USD", 0);
    bot.cooldown_minutes = 0;
    engine.add_bot(bot);

    uint64_t cursor = 0;
    engine.set_clock([&cursor]() { return cursor * 1000000ULL; });

    size_t buys = 0;
    size_t sells = 0;
    for (uint64_t ts : market.timeline()) {
        cursor = ts;
        market.set_cursor_ms(ts);
        CycleResult c = engine.run_cycle(1);
        engine.poll_orders();
        if (c.execution.success) {
            if (c.evaluation.action == TradeAction::Buy)
                ++buys;
            else
                ++sells;
        }
    }

    ASSERT_TRUE(buys > 0);
    ASSERT_TRUE(sells > 0);
    ASSERT_TRUE(broker.total_fills() == buys + sells);
    ASSERT_TRUE(engine.registry().runtime(1)->current_position_size >= 0);
    for (const auto& t : engine.trades().all()) {
        ASSERT_TRUE(t.status == execution::TradeStatus::Completed);
    }
}

int main() {
    std::cout << "\n=== Bot Engine Tests ===\n\n";

    std::cout << "--- Cycle ---\n";
    RUN_TEST(buy_after_confirmation);
    RUN_TEST(sell_without_position_skipped);
    RUN_TEST(sell_capped_at_held_position);
    RUN_TEST(hold_and_errors_skip_trading);
    RUN_TEST(stopped_and_unknown_bots);
    RUN_TEST(market_data_failure_holds);
    RUN_TEST(duplicate_bot_rejected);

    std::cout << "\n--- Queries ---\n";
    RUN_TEST(history_newest_first);
    RUN_TEST(temperature_and_confirmation_queries);
    RUN_TEST(evaluate_with_regime_scales_size);
    RUN_TEST(regime_analysis_from_market_data);

    std::cout << "\n--- Concurrency and Replay ---\n";
    RUN_TEST(run_all_evaluates_each_bot);
    RUN_TEST(replay_with_paper_broker);

    std::cout << "\n=== All tests passed! ===\n\n";
    return 0;
}
