/**
 * Bot Runner
 *
 * Replays recorded candles through the full bot pipeline with the paper
 * broker. Every replay step moves the market cursor one candle forward,
 * runs one cycle for every bot concurrently, then polls pending orders.
 *
 * Usage:
 *   ./bot_runner --config bots.json --data-dir data/
 */

#include "../include/bot_engine.hpp"
#include "../include/config/config_loader.hpp"
#include "../include/exchange/paper_broker.hpp"
#include "../include/exchange/replay_market_data.hpp"
#include "../include/strategy/evaluation_json.hpp"
#include "../include/util/cli.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <set>

using namespace tradebot;

namespace {

std::string format_time(uint64_t ts_ms) {
    time_t t = static_cast<time_t>(ts_ms / 1000);
    struct tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

void print_cycle(uint64_t ts_ms, const CycleResult& cycle, const execution::TradeStore& trades) {
    if (!cycle.trade_attempted) {
        return;
    }
    const auto& exec = cycle.execution;
    std::cout << format_time(ts_ms) << "  bot " << cycle.bot_id << "  "
              << strategy::action_to_string(cycle.evaluation.action) << "  score " << std::fixed
              << std::setprecision(3) << cycle.evaluation.overall_score << "  ";
    if (exec.success) {
        auto trade = trades.get(exec.trade_id);
        std::cout << "trade " << exec.trade_id << " " << std::setprecision(8) << exec.base_size << " @ "
                  << std::setprecision(2) << (trade ? trade->price : exec.price) << " ("
                  << (trade ? execution::trade_status_to_string(trade->status) : "?") << ")\n";
    } else {
        std::cout << "rejected: " << reject_reason_to_string(exec.reason) << " - " << exec.error << "\n";
    }
}

void print_summary(BotEngine& engine, const std::set<std::string>& pairs) {
    std::cout << "\n========================================\n";
    std::cout << "Positions\n";
    std::cout << "========================================\n";
    std::cout << std::fixed;
    for (const auto& pair : pairs) {
        trading::PositionSummary s = engine.get_position_summary(pair);
        std::cout << std::left << std::setw(10) << pair << std::right << " qty " << std::setprecision(8)
                  << s.current_quantity << "  avg " << std::setprecision(2) << s.average_cost_basis << "  realized "
                  << s.realized_pnl << "  unrealized " << s.unrealized_pnl << "  fees " << s.total_fees << "  ("
                  << s.buy_count << " buys, " << s.sell_count << " sells)\n";
    }

    std::cout << "\nBots\n";
    for (BotId id : engine.registry().ids()) {
        auto trades = engine.trades().trades_for(id);
        size_t completed = 0;
        size_t failed = 0;
        for (const auto& t : trades) {
            if (t.status == execution::TradeStatus::Completed)
                ++completed;
            else if (t.status != execution::TradeStatus::Pending)
                ++failed;
        }
        auto rt = engine.registry().runtime(id);
        TemperatureReport temp = engine.temperature_report(id);
        std::cout << "  bot " << id << ": " << completed << " filled, " << failed << " failed, position $"
                  << std::setprecision(2) << (rt ? rt->current_position_size : 0.0) << ", last "
                  << strategy::temperature_to_string(temp.temperature) << " (" << std::setprecision(3) << temp.score
                  << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        util::print_help();
        return 0;
    }

    logging::AsyncLogger logger;
    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::LogLevel::Warn);
    logger.start();

    config::AppConfig app;
    try {
        app = config::load_config_file(args.config_path);
    } catch (const ValidationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    if (app.bots.empty()) {
        std::cerr << "No bots configured\n";
        return 1;
    }

    exchange::ReplayMarketData market;
    std::set<std::string> pairs;
    for (const auto& bot : app.bots) {
        pairs.insert(bot.pair);
    }
    for (const auto& pair : pairs) {
        auto it = args.candle_files.find(pair);
        std::string path = it != args.candle_files.end() ? it->second : args.data_dir + "/" + pair + ".csv";
        try {
            auto candles = exchange::load_candles_csv(path);
            std::cout << "Loaded " << candles.size() << " candles for " << pair << " from " << path << "\n";
            market.add_series(pair, std::move(candles));
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    risk::StaticSafetyPolicy safety(app.safety);
    exchange::PaperBroker broker(market);

    EngineConfig engine_config;
    engine_config.sizing = app.sizing;
    engine_config.executor = app.executor;

    BotEngine engine(market, broker, safety, engine_config, &logger);
    engine.set_clock([&market]() { return market.cursor_ms() * 1'000'000ULL; });
    engine.set_alert_callback([](const execution::Trade& trade, const std::string& message) {
        std::cerr << "ALERT bot " << trade.bot_id << ": " << message << "\n";
    });

    for (const auto& bot : app.bots) {
        try {
            engine.add_bot(bot);
        } catch (const ValidationError& e) {
            std::cerr << "Skipping bot " << bot.id << ": " << e.what() << "\n";
        }
    }

    std::vector<uint64_t> timeline = market.timeline();
    size_t first = std::min(static_cast<size_t>(args.warmup), timeline.size());
    size_t last = timeline.size();
    if (args.steps > 0) {
        last = std::min(last, first + static_cast<size_t>(args.steps));
    }

    std::cout << "Replaying " << (last - first) << " steps across " << engine.registry().ids().size()
              << " bots\n\n";

    for (size_t i = first; i < last; ++i) {
        market.set_cursor_ms(timeline[i]);
        std::vector<CycleResult> cycles = engine.run_all();
        engine.poll_orders();

        for (const auto& cycle : cycles) {
            if (args.json_output && cycle.evaluated) {
                std::cout << nlohmann::json(cycle.evaluation).dump() << "\n";
            }
            print_cycle(timeline[i], cycle, engine.trades());
        }
    }

    print_summary(engine, pairs);
    std::cout << "\nBroker: " << broker.total_orders() << " orders, " << broker.total_fills() << " fills, $"
              << std::setprecision(2) << broker.total_commission() << " commission\n";

    logger.stop();
    if (logger.dropped_count() > 0) {
        std::cerr << logger.dropped_count() << " log entries dropped\n";
    }
    return 0;
}
