#pragma once

#include "config/bot_config.hpp"
#include "exchange/broker_client.hpp"
#include "exchange/market_data.hpp"
#include "execution/bot_registry.hpp"
#include "execution/trade_executor.hpp"
#include "execution/trade_store.hpp"
#include "logging/async_logger.hpp"
#include "risk/safety_policy.hpp"
#include "strategy/action_resolver.hpp"
#include "strategy/confirmation_tracker.hpp"
#include "strategy/evaluation.hpp"
#include "strategy/signal_aggregator.hpp"
#include "strategy/trend_analyzer.hpp"
#include "trading/evaluation_history.hpp"
#include "trading/position_ledger.hpp"
#include "trading/position_sizer.hpp"
#include "types.hpp"
#include "util/time_utils.hpp"

#include <string>
#include <vector>

namespace tradebot {

struct EngineConfig {
    trading::SizingConfig sizing;
    execution::ExecutorConfig executor;
    strategy::TrendAnalyzerConfig trend;
    size_t history_limit = 500;
    bool analyze_regime = true; // false sizes every trade with the Unknown regime
};

/**
 * Outcome of one run_cycle call
 */
struct CycleResult {
    BotId bot_id = INVALID_BOT_ID;
    bool evaluated = false;
    strategy::EvaluationResult evaluation;
    bool trade_attempted = false;
    execution::ExecutionResult execution;
    std::string skipped; // why no trade was attempted
};

struct TemperatureReport {
    BotId bot_id = INVALID_BOT_ID;
    bool available = false; // false until the bot has been evaluated
    std::string pair;
    double score = 0;
    strategy::Temperature temperature = strategy::Temperature::Frozen;
    strategy::TradeAction action = strategy::TradeAction::Hold;
    strategy::ActionDistance distance;
    Timestamp evaluated_at = NO_TIMESTAMP;
};

/**
 * BotEngine - one evaluation cycle per bot
 *
 *   market data -> SignalAggregator -> ActionResolver -> ConfirmationTracker
 *     -> (confirmed) PositionSizer -> TradeExecutor -> broker -> PositionLedger
 *
 * Owns the per-bot state (registry, trades, ledger, confirmation,
 * history); market data, broker and safety policy are injected.
 * run_cycle may be called for different bots from different threads,
 * and for the same bot from a scheduler and a manual trigger at once.
 *
 * Usage:
 *   BotEngine engine(market, broker, safety);
 *   engine.add_bot(config);
 *   CycleResult r = engine.run_cycle(config.id);
 *   engine.poll_orders();
 */
class BotEngine {
public:
    BotEngine(exchange::IMarketDataProvider& market, exchange::IBrokerClient& broker,
              const risk::ISafetyPolicy& safety, const EngineConfig& config = EngineConfig(),
              logging::AsyncLogger* logger = nullptr);

    BotEngine(const BotEngine&) = delete;
    BotEngine& operator=(const BotEngine&) = delete;

    // ========================================
    // Setup
    // ========================================

    void add_bot(const config::BotConfig& bot);
    void set_clock(util::ClockFn clock);
    void set_alert_callback(execution::TradeExecutor::AlertCallback cb);

    // ========================================
    // Pipeline
    // ========================================

    // Aggregate, resolve, advance confirmation and size. Uses the Unknown regime.
    strategy::EvaluationResult evaluate(const config::BotConfig& bot, const std::vector<exchange::Candle>& candles);
    strategy::EvaluationResult evaluate(const config::BotConfig& bot, const std::vector<exchange::Candle>& candles,
                                        const strategy::RegimeDescriptor& regime);

    execution::ExecutionResult execute_trade(BotId bot, Side side, double size_usd,
                                             strategy::Temperature temperature);

    // Fetch, evaluate and trade if confirmed
    CycleResult run_cycle(BotId bot);

    // run_cycle for every running bot, one thread per bot; results ordered by bot id
    std::vector<CycleResult> run_all();

    size_t poll_orders();

    // ========================================
    // Queries
    // ========================================

    strategy::ConfirmationStatus get_confirmation_status(BotId bot) const;
    trading::PositionSummary get_position_summary(const std::string& pair);
    std::vector<strategy::EvaluationResult> history(BotId bot, size_t limit) const;
    TemperatureReport temperature_report(BotId bot) const;

    execution::BotRegistry& registry() { return registry_; }
    execution::TradeStore& trades() { return trades_; }
    trading::PositionLedger& ledger() { return ledger_; }
    execution::TradeExecutor& executor() { return executor_; }

private:
    exchange::IMarketDataProvider& market_;
    const risk::ISafetyPolicy& safety_;
    EngineConfig config_;
    logging::AsyncLogger* logger_;
    util::ClockFn clock_;

    execution::BotRegistry registry_;
    execution::TradeStore trades_;
    trading::PositionLedger ledger_;
    strategy::SignalAggregator aggregator_;
    strategy::ConfirmationTracker confirmations_;
    strategy::TrendAnalyzer trend_;
    trading::PositionSizer sizer_;
    trading::EvaluationHistory history_;
    execution::TradeExecutor executor_;
};

} // namespace tradebot
