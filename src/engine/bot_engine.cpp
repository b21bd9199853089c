#include "../../include/bot_engine.hpp"
#include "../../include/strategy/evaluation_json.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace tradebot {

BotEngine::BotEngine(exchange::IMarketDataProvider& market, exchange::IBrokerClient& broker,
                     const risk::ISafetyPolicy& safety, const EngineConfig& config, logging::AsyncLogger* logger)
    : market_(market)
    , safety_(safety)
    , config_(config)
    , logger_(logger)
    , clock_(util::system_clock())
    , ledger_(logger)
    , aggregator_(logger)
    , confirmations_(logger)
    , trend_(config.trend, logger)
    , sizer_(config.sizing)
    , history_(config.history_limit)
    , executor_(registry_, trades_, ledger_, market, broker, safety, config.executor, logger) {}

void BotEngine::add_bot(const config::BotConfig& bot) {
    registry_.add(bot);
    if (bot.has_config_error()) {
        LOGF_WARN(logger_, logging::LogCategory::System, "bot %u (%s) loaded with config error: %s", bot.id,
                  bot.pair.c_str(), bot.config_error.c_str());
    } else {
        LOGF_INFO(logger_, logging::LogCategory::System, "bot %u (%s) on %s: %zu indicators", bot.id,
                  bot.name.c_str(), bot.pair.c_str(), bot.enabled_indicator_count());
    }
}

void BotEngine::set_clock(util::ClockFn clock) {
    clock_ = clock;
    executor_.set_clock(std::move(clock));
}

void BotEngine::set_alert_callback(execution::TradeExecutor::AlertCallback cb) {
    executor_.set_alert_callback(std::move(cb));
}

strategy::EvaluationResult BotEngine::evaluate(const config::BotConfig& bot,
                                               const std::vector<exchange::Candle>& candles) {
    return evaluate(bot, candles, strategy::RegimeDescriptor{});
}

strategy::EvaluationResult BotEngine::evaluate(const config::BotConfig& bot,
                                               const std::vector<exchange::Candle>& candles,
                                               const strategy::RegimeDescriptor& regime) {
    const Timestamp now = clock_();

    strategy::EvaluationResult result = aggregator_.aggregate(bot, candles);
    result.timestamp = now;
    result.regime = regime;
    result.confirmation = confirmations_.observe(bot.id, result.action, bot.confirmation_minutes, now);

    risk::SafetyLimits limits = safety_.limits();
    result.sizing = sizer_.size(bot.base_position_size_usd, result.confidence, regime, limits.min_position_usd,
                                limits.max_position_usd);

    registry_.update_runtime(bot.id, [&result, now](execution::BotRuntime& rt) {
        rt.current_combined_score = result.overall_score;
        rt.last_evaluated_at = now;
    });
    history_.append(result);

    LOGF_INFO(logger_, logging::LogCategory::Signal, "bot %u %s: score=%.3f %s %s [%s %.0f%%] size=%.2f", bot.id,
              bot.pair.c_str(), result.overall_score, strategy::action_to_string(result.action),
              strategy::temperature_to_string(result.temperature),
              strategy::confirmation_state_to_string(result.confirmation.state), result.confirmation.progress * 100.0,
              result.sizing.final_size_usd);
    return result;
}

execution::ExecutionResult BotEngine::execute_trade(BotId bot, Side side, double size_usd,
                                                    strategy::Temperature temperature) {
    return executor_.execute_trade(bot, side, size_usd, temperature);
}

CycleResult BotEngine::run_cycle(BotId bot) {
    CycleResult cycle;
    cycle.bot_id = bot;

    auto cfg = registry_.config(bot);
    if (!cfg) {
        cycle.skipped = "bot not found";
        return cycle;
    }
    if (cfg->status != BotStatus::Running) {
        cycle.skipped = std::string("bot is ") + bot_status_to_string(cfg->status);
        return cycle;
    }

    std::vector<exchange::Candle> candles;
    try {
        candles = market_.get_historical(cfg->pair, cfg->candle_granularity_sec, cfg->candle_limit);
    } catch (const std::exception& e) {
        LOGF_WARN(logger_, logging::LogCategory::Market, "bot %u: candles for %s unavailable: %s", bot,
                  cfg->pair.c_str(), e.what());
    }

    strategy::RegimeDescriptor regime;
    if (config_.analyze_regime) {
        regime = trend_.analyze(market_, cfg->pair).regime;
    }

    cycle.evaluation = evaluate(*cfg, candles, regime);
    cycle.evaluated = true;

    const auto& eval = cycle.evaluation;
    if (eval.action == strategy::TradeAction::Hold) {
        cycle.skipped = eval.has_error() ? eval.error : "hold";
        return cycle;
    }
    if (!eval.confirmation.is_confirmed) {
        cycle.skipped = "awaiting confirmation";
        return cycle;
    }

    Side side = eval.action == strategy::TradeAction::Buy ? Side::Buy : Side::Sell;
    double size_usd = eval.sizing.final_size_usd;

    if (side == Side::Sell) {
        auto rt = registry_.runtime(bot);
        double held = rt ? rt->current_position_size : 0;
        if (held <= 0) {
            cycle.skipped = "no position to sell";
            return cycle;
        }
        size_usd = std::min(size_usd, held);
    }

    cycle.trade_attempted = true;
    cycle.execution = executor_.execute_trade(bot, side, size_usd, eval.temperature, strategy::signal_snapshot(eval));
    if (!cycle.execution.success) {
        LOGF_INFO(logger_, logging::LogCategory::Order, "bot %u: %s not executed: %s", bot, side_to_string(side),
                  cycle.execution.error.c_str());
    }
    return cycle;
}

std::vector<CycleResult> BotEngine::run_all() {
    std::vector<BotId> ids = registry_.ids();
    std::vector<CycleResult> results(ids.size());
    std::vector<std::thread> workers;
    workers.reserve(ids.size());

    for (size_t i = 0; i < ids.size(); ++i) {
        workers.emplace_back([this, &results, &ids, i]() { results[i] = run_cycle(ids[i]); });
    }
    for (auto& w : workers) {
        w.join();
    }
    return results;
}

size_t BotEngine::poll_orders() {
    return executor_.poll_pending_orders();
}

strategy::ConfirmationStatus BotEngine::get_confirmation_status(BotId bot) const {
    auto cfg = registry_.config(bot);
    int window = cfg ? cfg->confirmation_minutes : 0;
    return confirmations_.status(bot, window, clock_());
}

trading::PositionSummary BotEngine::get_position_summary(const std::string& pair) {
    std::optional<double> price;
    try {
        price = market_.get_price(pair);
    } catch (const std::exception& e) {
        LOGF_WARN(logger_, logging::LogCategory::Market, "price for %s unavailable: %s", pair.c_str(), e.what());
    }
    return ledger_.summary(pair, price);
}

std::vector<strategy::EvaluationResult> BotEngine::history(BotId bot, size_t limit) const {
    return history_.recent(bot, limit);
}

TemperatureReport BotEngine::temperature_report(BotId bot) const {
    TemperatureReport report;
    report.bot_id = bot;

    auto cfg = registry_.config(bot);
    auto latest = history_.latest(bot);
    if (!cfg || !latest) {
        return report;
    }

    report.available = true;
    report.pair = cfg->pair;
    report.score = latest->overall_score;
    report.temperature = latest->temperature;
    report.action = latest->action;
    report.distance = strategy::distance_to_action(latest->overall_score, cfg->buy_threshold, cfg->sell_threshold);
    report.evaluated_at = latest->timestamp;
    return report;
}

} // namespace tradebot
