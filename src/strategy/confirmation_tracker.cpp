#include "../../include/strategy/confirmation_tracker.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>

namespace tradebot::strategy {

ConfirmationTracker::ConfirmationTracker(logging::AsyncLogger* logger) : logger_(logger) {}

ConfirmationTracker::Slot& ConfirmationTracker::slot_for(BotId bot) {
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        auto it = slots_.find(bot);
        if (it != slots_.end()) {
            return *it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    auto& slot = slots_[bot];
    if (!slot) {
        slot = std::make_unique<Slot>();
    }
    return *slot;
}

const ConfirmationTracker::Slot* ConfirmationTracker::find_slot(BotId bot) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = slots_.find(bot);
    return it == slots_.end() ? nullptr : it->second.get();
}

ConfirmationStatus ConfirmationTracker::describe(const Record& record, int confirmation_minutes, Timestamp now) {
    ConfirmationStatus s;
    s.state = record.state;
    s.action = record.action;
    s.confirmation_start = record.start;

    switch (record.state) {
    case ConfirmationState::NoSignal:
        break;
    case ConfirmationState::Confirmed:
        s.is_confirmed = true;
        s.progress = 1.0;
        break;
    case ConfirmationState::Confirming: {
        s.needs_confirmation = true;
        double elapsed = now > record.start ? util::ns_to_minutes(now - record.start) : 0.0;
        if (confirmation_minutes <= 0) {
            s.progress = 1.0;
        } else {
            s.progress = std::clamp(elapsed / confirmation_minutes, 0.0, 1.0);
            s.time_remaining_minutes = std::max(0.0, confirmation_minutes - elapsed);
        }
        break;
    }
    }
    return s;
}

ConfirmationStatus ConfirmationTracker::observe(BotId bot, TradeAction action, int confirmation_minutes,
                                                Timestamp now) {
    Slot& slot = slot_for(bot);
    std::lock_guard<std::mutex> lock(slot.mutex);
    Record& rec = slot.record;

    if (action == TradeAction::Hold) {
        if (rec.state != ConfirmationState::NoSignal) {
            LOGF_DEBUG(logger_, logging::LogCategory::Confirmation, "bot %u: %s reset by hold", bot,
                       action_to_string(rec.action));
        }
        rec = Record{};
        return describe(rec, confirmation_minutes, now);
    }

    if (rec.state == ConfirmationState::NoSignal || rec.action != action) {
        LOGF_INFO(logger_, logging::LogCategory::Confirmation, "bot %u: confirming %s (was %s)", bot,
                  action_to_string(action), action_to_string(rec.action));
        rec.state = ConfirmationState::Confirming;
        rec.action = action;
        rec.start = now;
    }

    if (rec.state == ConfirmationState::Confirming) {
        uint64_t window = util::minutes_to_ns(confirmation_minutes);
        uint64_t elapsed = now > rec.start ? now - rec.start : 0;
        if (elapsed >= window) {
            rec.state = ConfirmationState::Confirmed;
            LOGF_INFO(logger_, logging::LogCategory::Confirmation, "bot %u: %s confirmed after %.1f min", bot,
                      action_to_string(action), util::ns_to_minutes(elapsed));
        }
    }

    return describe(rec, confirmation_minutes, now);
}

ConfirmationStatus ConfirmationTracker::status(BotId bot, int confirmation_minutes, Timestamp now) const {
    const Slot* slot = find_slot(bot);
    if (!slot) {
        return ConfirmationStatus{};
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return describe(slot->record, confirmation_minutes, now);
}

void ConfirmationTracker::reset(BotId bot) {
    Slot& slot = slot_for(bot);
    std::lock_guard<std::mutex> lock(slot.mutex);
    slot.record = Record{};
}

} // namespace tradebot::strategy
