#include "../../include/execution/trade_executor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tradebot::execution {

TradeExecutor::TradeExecutor(BotRegistry& registry, TradeStore& trades, trading::PositionLedger& ledger,
                             exchange::IMarketDataProvider& market, exchange::IBrokerClient& broker,
                             const risk::ISafetyPolicy& safety, const ExecutorConfig& config,
                             logging::AsyncLogger* logger)
    : registry_(registry)
    , trades_(trades)
    , ledger_(ledger)
    , market_(market)
    , broker_(broker)
    , safety_(safety)
    , config_(config)
    , logger_(logger)
    , clock_(util::system_clock()) {}

double TradeExecutor::round_quantity(double quantity, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(quantity * scale) / scale;
}

ExecutionResult TradeExecutor::execute_trade(BotId bot, Side side, double size_usd,
                                             strategy::Temperature temperature,
                                             const std::string& signal_snapshot) {
    // 1. Bot exists and is running
    auto cfg = registry_.config(bot);
    if (!cfg) {
        return ExecutionResult::rejected(RejectReason::BotNotFound, "bot " + std::to_string(bot) + " not found");
    }
    if (cfg->status != BotStatus::Running) {
        return ExecutionResult::rejected(RejectReason::BotNotTradeable,
                                         "bot " + std::to_string(bot) + " is " + bot_status_to_string(cfg->status));
    }

    std::timed_mutex* trade_lock = registry_.trade_lock(bot);
    if (!trade_lock) {
        return ExecutionResult::rejected(RejectReason::BotNotFound, "bot " + std::to_string(bot) + " not found");
    }

    std::unique_lock<std::timed_mutex> lock(*trade_lock, std::defer_lock);
    if (!lock.try_lock_for(config_.lock_timeout)) {
        LOGF_WARN(logger_, logging::LogCategory::Order, "bot %u: lock timeout, trade already in progress", bot);
        return ExecutionResult::rejected(RejectReason::TradeInProgress,
                                         "trade is currently in progress for bot " + std::to_string(bot));
    }

    return execute_locked(*cfg, side, size_usd, temperature, signal_snapshot);
}

ExecutionResult TradeExecutor::execute_locked(const config::BotConfig& bot, Side side, double size_usd,
                                              strategy::Temperature temperature,
                                              const std::string& signal_snapshot) {
    const Timestamp now = clock_();
    const uint64_t today = util::day_index(now);

    // 2. Safety limits
    risk::DailyActivity activity;
    activity.trade_count = trades_.trade_count_on_day(bot.id, today);
    activity.realized_loss_usd = std::max(0.0, -trades_.realized_pnl_on_day(bot.id, today));

    risk::SafetyLimits limits = safety_.limits();
    RejectReason safety = risk::check_safety(limits, size_usd, temperature, bot.min_temperature_to_trade, activity);
    if (safety != RejectReason::None) {
        LOGF_INFO(logger_, logging::LogCategory::Order, "bot %u: %s %.2f USD rejected: %s", bot.id,
                  side_to_string(side), size_usd, reject_reason_to_string(safety));
        return ExecutionResult::rejected(safety, std::string("safety check failed: ") +
                                                     reject_reason_to_string(safety));
    }

    // 3. One in-flight order per bot
    if (trades_.has_pending(bot.id)) {
        return ExecutionResult::rejected(RejectReason::PendingOrderExists,
                                         "bot " + std::to_string(bot.id) + " already has a pending order");
    }

    // 4. Cooldown from the last filled trade only
    const uint64_t cooldown_ns = util::minutes_to_ns(bot.cooldown_minutes);
    Timestamp last_fill = trades_.last_filled_at(bot.id);
    if (cooldown_ns > 0 && last_fill != NO_TIMESTAMP) {
        uint64_t elapsed = now > last_fill ? now - last_fill : 0;
        if (elapsed <= cooldown_ns) {
            double remaining = util::ns_to_minutes(cooldown_ns - elapsed);
            char msg[128];
            std::snprintf(msg, sizeof(msg), "cooldown active for bot %u: %.1f minutes remaining", bot.id, remaining);
            return ExecutionResult::rejected(RejectReason::CooldownActive, msg);
        }
    }

    // Price
    std::optional<double> price;
    try {
        price = market_.get_price(bot.pair);
    } catch (const std::exception& e) {
        LOGF_ERROR(logger_, logging::LogCategory::Market, "price fetch for %s failed: %s", bot.pair.c_str(),
                   e.what());
        return ExecutionResult::rejected(RejectReason::PriceUnavailable,
                                         std::string("price fetch failed: ") + e.what());
    }
    if (!price || !(*price > 0)) {
        return ExecutionResult::rejected(RejectReason::PriceUnavailable, "no current price for " + bot.pair);
    }

    double quantity = round_quantity(size_usd / *price, config_.quantity_decimals);
    if (!(quantity > 0)) {
        return ExecutionResult::rejected(RejectReason::InvalidSize, "order rounds to zero quantity");
    }

    // Pending row before the broker call, so a crash in between leaves a visible record
    Trade trade;
    trade.bot_id = bot.id;
    trade.pair = bot.pair;
    trade.side = side;
    trade.size = quantity;
    trade.size_usd = size_usd;
    trade.price = *price;
    trade.status = TradeStatus::Pending;
    trade.created_at = now;
    trade.signal_scores = signal_snapshot;
    TradeId trade_id = trades_.insert(trade);
    trade.id = trade_id;

    exchange::OrderAck ack;
    try {
        ack = broker_.place_order(bot.pair, side, quantity);
    } catch (const std::exception& e) {
        ack.accepted = false;
        ack.error = e.what();
    }

    if (!ack.accepted || ack.state == exchange::OrderState::Rejected) {
        std::string error = ack.error.empty() ? "order rejected by broker" : ack.error;
        trades_.fail(trade_id, TradeStatus::Failed, error);
        LOGF_ERROR(logger_, logging::LogCategory::Order, "bot %u: %s %.8f %s failed: %s", bot.id,
                   side_to_string(side), quantity, bot.pair.c_str(), error.c_str());

        ExecutionResult r = ExecutionResult::rejected(RejectReason::BrokerError, "broker error: " + error);
        r.trade_id = trade_id;
        r.base_size = quantity;
        r.price = *price;
        return r;
    }

    trades_.set_order_id(trade_id, ack.order_id);
    LOGF_INFO(logger_, logging::LogCategory::Order, "bot %u: %s %.8f %s @ ~%.4f order %s (trade %llu)", bot.id,
              side_to_string(side), quantity, bot.pair.c_str(), *price, ack.order_id.c_str(),
              static_cast<unsigned long long>(trade_id));

    if (exchange::is_terminal(ack.state)) {
        exchange::OrderStatusReport report;
        report.state = ack.state;
        report.fill_price = ack.fill_price;
        report.filled_quantity = ack.filled_quantity;
        report.fee = ack.fee;
        report.error = ack.error;
        apply_order_status(trade_id, report);
    }

    ExecutionResult result;
    result.success = true;
    result.trade_id = trade_id;
    result.order_id = ack.order_id;
    result.base_size = quantity;
    result.price = *price;
    return result;
}

bool TradeExecutor::apply_order_status(TradeId trade_id, const exchange::OrderStatusReport& report) {
    auto trade = trades_.get(trade_id);
    if (!trade || is_terminal(trade->status)) {
        return false;
    }

    switch (report.state) {
    case exchange::OrderState::Filled: {
        double fill_price = report.fill_price > 0 ? report.fill_price : trade->price;
        if (!trades_.complete(trade_id, clock_(), fill_price, report.filled_quantity, report.fee)) {
            return false;
        }
        apply_fill(*trades_.get(trade_id));
        return true;
    }
    case exchange::OrderState::Cancelled:
    case exchange::OrderState::Rejected: {
        TradeStatus status =
            report.state == exchange::OrderState::Cancelled ? TradeStatus::Cancelled : TradeStatus::Failed;
        if (!trades_.fail(trade_id, status, report.error)) {
            return false;
        }
        LOGF_WARN(logger_, logging::LogCategory::Order, "trade %llu (%s) %s: %s",
                  static_cast<unsigned long long>(trade_id), trade->order_id.c_str(), trade_status_to_string(status),
                  report.error.c_str());
        return true;
    }
    default:
        return false;
    }
}

void TradeExecutor::apply_fill(const Trade& trade) {
    // A short fill moves the position by the filled share of the requested amount
    double filled_usd = trade.size > 0 ? trade.size_usd * (trade.filled_quantity / trade.size) : 0.0;
    registry_.update_runtime(trade.bot_id, [&trade, filled_usd](BotRuntime& rt) {
        if (trade.side == Side::Buy) {
            rt.current_position_size += filled_usd;
        } else {
            rt.current_position_size = std::max(0.0, rt.current_position_size - filled_usd);
        }
    });

    trading::Fill fill;
    fill.fill_id = trade.order_id.empty() ? "trade-" + std::to_string(trade.id) : trade.order_id;
    fill.pair = trade.pair;
    fill.side = trade.side;
    fill.quantity = trade.filled_quantity;
    fill.price = trade.price;
    fill.fee = trade.fee;
    fill.timestamp = trade.filled_at;

    trading::FillOutcome outcome = ledger_.record_fill(fill);
    if (outcome.result == trading::FillResult::Applied && trade.side == Side::Sell) {
        trades_.set_realized_pnl(trade.id, outcome.realized_pnl);
    } else if (outcome.result != trading::FillResult::Applied) {
        LOGF_WARN(logger_, logging::LogCategory::Position, "trade %llu fill %s not applied to ledger: %s",
                  static_cast<unsigned long long>(trade.id), fill.fill_id.c_str(),
                  trading::fill_result_to_string(outcome.result));
    }

    LOGF_INFO(logger_, logging::LogCategory::Order, "trade %llu filled: %s %.8f %s @ %.4f fee %.4f pnl %.4f",
              static_cast<unsigned long long>(trade.id), side_to_string(trade.side), fill.quantity,
              trade.pair.c_str(), fill.price, fill.fee, outcome.realized_pnl);
}

void TradeExecutor::check_stale(const Trade& trade, Timestamp now) {
    uint64_t window = util::minutes_to_ns(config_.stale_pending_minutes);
    if (window == 0 || now <= trade.created_at || now - trade.created_at < window) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(alerted_mutex_);
        if (!alerted_.insert(trade.id).second) {
            return;
        }
    }

    char msg[160];
    std::snprintf(msg, sizeof(msg), "trade %llu for bot %u pending for %.1f minutes (order %s)",
                  static_cast<unsigned long long>(trade.id), trade.bot_id, util::ns_to_minutes(now - trade.created_at),
                  trade.order_id.empty() ? "none" : trade.order_id.c_str());
    LOG_WARN(logger_, logging::LogCategory::Order, msg);
    if (on_alert_) {
        on_alert_(trade, msg);
    }
}

size_t TradeExecutor::poll_pending_orders() {
    size_t transitioned = 0;

    for (const Trade& trade : trades_.pending()) {
        if (!trade.order_id.empty()) {
            exchange::OrderStatusReport report;
            try {
                report = broker_.get_order_status(trade.order_id);
            } catch (const std::exception& e) {
                LOGF_WARN(logger_, logging::LogCategory::Order, "status poll for order %s failed: %s",
                          trade.order_id.c_str(), e.what());
                report.state = exchange::OrderState::Unknown;
            }

            if (exchange::is_terminal(report.state) && apply_order_status(trade.id, report)) {
                ++transitioned;
                continue;
            }
        }
        check_stale(trade, clock_());
    }
    return transitioned;
}

} // namespace tradebot::execution
