#pragma once

#include "../errors.hpp"
#include "../types.hpp"

#include <string>

namespace tradebot {
namespace execution {

enum class TradeStatus : uint8_t { Pending = 0, Completed, Failed, Cancelled };

inline const char* trade_status_to_string(TradeStatus status) {
    switch (status) {
    case TradeStatus::Pending:
        return "pending";
    case TradeStatus::Completed:
        return "completed";
    case TradeStatus::Failed:
        return "failed";
    case TradeStatus::Cancelled:
        return "cancelled";
    default:
        return "unknown";
    }
}

inline bool is_terminal(TradeStatus status) {
    return status != TradeStatus::Pending;
}

/**
 * Trade row. Created pending at submission; moves to exactly one
 * terminal status. filled_at is set only on a confirmed fill and is
 * what cooldowns are measured from.
 */
struct Trade {
    TradeId id = INVALID_TRADE_ID;
    BotId bot_id = INVALID_BOT_ID;
    std::string pair;
    Side side = Side::Buy;
    double size = 0;     // base quantity
    double filled_quantity = 0; // base quantity the broker filled, set on completion
    double size_usd = 0; // requested quote amount
    double price = 0;    // quote at submission, replaced by fill price on completion
    double fee = 0;
    std::string order_id; // empty until the broker accepts
    TradeStatus status = TradeStatus::Pending;
    Timestamp created_at = NO_TIMESTAMP;
    Timestamp filled_at = NO_TIMESTAMP;
    std::string signal_scores; // JSON snapshot of the evaluation that triggered it
    double realized_pnl = 0;   // sells, set on completion
    std::string error;         // broker error for failed trades
};

/**
 * Result of execute_trade. On rejection no Trade row exists unless
 * the broker itself failed, in which case trade_id names the failed row.
 */
struct ExecutionResult {
    bool success = false;
    TradeId trade_id = INVALID_TRADE_ID;
    std::string order_id;
    ErrorKind error_kind = ErrorKind::None;
    RejectReason reason = RejectReason::None;
    std::string error;
    double base_size = 0;
    double price = 0;

    static ExecutionResult rejected(RejectReason reason, std::string message) {
        ExecutionResult r;
        r.reason = reason;
        r.error_kind = error_kind_for(reason);
        r.error = std::move(message);
        return r;
    }
};

} // namespace execution
} // namespace tradebot
