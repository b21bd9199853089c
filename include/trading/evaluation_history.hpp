#pragma once

#include "../strategy/evaluation.hpp"

#include <algorithm>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tradebot {
namespace trading {

/**
 * EvaluationHistory - append-only per-bot evaluation log
 *
 * Keeps the most recent `capacity` results per bot; older entries drop
 * off the front.
 */
class EvaluationHistory {
public:
    explicit EvaluationHistory(size_t capacity = 500) : capacity_(std::max<size_t>(capacity, 1)) {}

    void append(const strategy::EvaluationResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& log = entries_[result.bot_id];
        log.push_back(result);
        while (log.size() > capacity_) {
            log.pop_front();
        }
    }

    // Newest first, at most `limit` entries
    std::vector<strategy::EvaluationResult> recent(BotId bot, size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<strategy::EvaluationResult> out;
        auto it = entries_.find(bot);
        if (it == entries_.end()) {
            return out;
        }
        const auto& log = it->second;
        size_t n = std::min(limit, log.size());
        out.reserve(n);
        for (auto rit = log.rbegin(); rit != log.rend() && out.size() < n; ++rit) {
            out.push_back(*rit);
        }
        return out;
    }

    std::optional<strategy::EvaluationResult> latest(BotId bot) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(bot);
        if (it == entries_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    size_t size(BotId bot) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(bot);
        return it == entries_.end() ? 0 : it->second.size();
    }

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<BotId, std::deque<strategy::EvaluationResult>> entries_;
};

} // namespace trading
} // namespace tradebot
