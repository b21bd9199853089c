#pragma once

#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "signal.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace tradebot {
namespace strategy {

enum class ConfirmationState : uint8_t { NoSignal = 0, Confirming, Confirmed };

inline const char* confirmation_state_to_string(ConfirmationState s) {
    switch (s) {
    case ConfirmationState::Confirming:
        return "confirming";
    case ConfirmationState::Confirmed:
        return "confirmed";
    default:
        return "no_signal";
    }
}

struct ConfirmationStatus {
    ConfirmationState state = ConfirmationState::NoSignal;
    TradeAction action = TradeAction::Hold;
    bool is_confirmed = false;
    bool needs_confirmation = false;
    double progress = 0; // [0, 1]
    Timestamp confirmation_start = NO_TIMESTAMP;
    double time_remaining_minutes = 0;
};

/**
 * ConfirmationTracker - whipsaw filter
 *
 * A non-hold action must persist unchanged for the bot's confirmation
 * window before it becomes actionable:
 *
 *   hold                      -> NoSignal, start cleared
 *   new or different action   -> Confirming(action, now)
 *   same action, window spent -> Confirmed(action)
 *   Confirmed                 -> stays until a different action or hold
 *
 * Each bot has its own mutex; bots never contend with each other
 * beyond the brief map lookup.
 */
class ConfirmationTracker {
public:
    explicit ConfirmationTracker(logging::AsyncLogger* logger = nullptr);

    ConfirmationTracker(const ConfirmationTracker&) = delete;
    ConfirmationTracker& operator=(const ConfirmationTracker&) = delete;

    // Apply one observation and return the resulting status
    ConfirmationStatus observe(BotId bot, TradeAction action, int confirmation_minutes, Timestamp now);

    // Current status without mutating state
    ConfirmationStatus status(BotId bot, int confirmation_minutes, Timestamp now) const;

    void reset(BotId bot);

private:
    struct Record {
        ConfirmationState state = ConfirmationState::NoSignal;
        TradeAction action = TradeAction::Hold;
        Timestamp start = NO_TIMESTAMP;
    };

    struct Slot {
        mutable std::mutex mutex;
        Record record;
    };

    logging::AsyncLogger* logger_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<BotId, std::unique_ptr<Slot>> slots_;

    Slot& slot_for(BotId bot);
    const Slot* find_slot(BotId bot) const;

    static ConfirmationStatus describe(const Record& record, int confirmation_minutes, Timestamp now);
};

} // namespace strategy
} // namespace tradebot
