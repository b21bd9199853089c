#include "../../include/execution/trade_store.hpp"
#include "../../include/util/time_utils.hpp"

#include <algorithm>

namespace tradebot::execution {

namespace {

void sort_by_id(std::vector<Trade>& trades) {
    std::sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) { return a.id < b.id; });
}

} // namespace

TradeId TradeStore::insert(Trade trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    trade.id = next_id_++;
    TradeId id = trade.id;
    trades_.emplace(id, std::move(trade));
    return id;
}

std::optional<Trade> TradeStore::get(TradeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TradeStore::has_pending(BotId bot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, t] : trades_) {
        if (t.bot_id == bot && t.status == TradeStatus::Pending) {
            return true;
        }
    }
    return false;
}

std::vector<Trade> TradeStore::pending() const {
    std::vector<Trade> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trades_) {
            if (t.status == TradeStatus::Pending) {
                out.push_back(t);
            }
        }
    }
    sort_by_id(out);
    return out;
}

Timestamp TradeStore::last_filled_at(BotId bot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp last = NO_TIMESTAMP;
    for (const auto& [id, t] : trades_) {
        if (t.bot_id == bot && t.filled_at != NO_TIMESTAMP) {
            last = std::max(last, t.filled_at);
        }
    }
    return last;
}

uint32_t TradeStore::trade_count_on_day(BotId bot, uint64_t day) const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0;
    for (const auto& [id, t] : trades_) {
        if (t.bot_id == bot && t.status != TradeStatus::Failed && util::day_index(t.created_at) == day) {
            ++count;
        }
    }
    return count;
}

double TradeStore::realized_pnl_on_day(BotId bot, uint64_t day) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double pnl = 0;
    for (const auto& [id, t] : trades_) {
        if (t.bot_id == bot && t.status == TradeStatus::Completed && util::day_index(t.filled_at) == day) {
            pnl += t.realized_pnl;
        }
    }
    return pnl;
}

bool TradeStore::set_order_id(TradeId id, const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end()) {
        return false;
    }
    it->second.order_id = order_id;
    return true;
}

bool TradeStore::complete(TradeId id, Timestamp filled_at, double fill_price, double filled_quantity, double fee) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end() || it->second.status != TradeStatus::Pending) {
        return false;
    }
    Trade& t = it->second;
    t.status = TradeStatus::Completed;
    t.filled_at = filled_at;
    if (fill_price > 0) {
        t.price = fill_price;
    }
    t.filled_quantity = filled_quantity > 0 ? std::min(filled_quantity, t.size) : t.size;
    t.fee = fee;
    return true;
}

bool TradeStore::fail(TradeId id, TradeStatus status, const std::string& error) {
    if (status == TradeStatus::Pending || status == TradeStatus::Completed) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end() || it->second.status != TradeStatus::Pending) {
        return false;
    }
    it->second.status = status;
    it->second.error = error;
    return true;
}

bool TradeStore::set_realized_pnl(TradeId id, double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trades_.find(id);
    if (it == trades_.end()) {
        return false;
    }
    it->second.realized_pnl = pnl;
    return true;
}

std::vector<Trade> TradeStore::trades_for(BotId bot) const {
    std::vector<Trade> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, t] : trades_) {
            if (t.bot_id == bot) {
                out.push_back(t);
            }
        }
    }
    sort_by_id(out);
    return out;
}

std::vector<Trade> TradeStore::all() const {
    std::vector<Trade> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(trades_.size());
        for (const auto& [id, t] : trades_) {
            out.push_back(t);
        }
    }
    sort_by_id(out);
    return out;
}

size_t TradeStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_.size();
}

} // namespace tradebot::execution
