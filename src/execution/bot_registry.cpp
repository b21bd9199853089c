#include "../../include/execution/bot_registry.hpp"
#include "../../include/errors.hpp"

#include <algorithm>
#include <string>

namespace tradebot::execution {

void BotRegistry::add(const config::BotConfig& config) {
    if (config.id == INVALID_BOT_ID) {
        throw ValidationError("bot id must be non-zero");
    }

    auto entry = std::make_unique<Entry>();
    entry->config = config;
    entry->runtime.status = config.status;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!bots_.emplace(config.id, std::move(entry)).second) {
        throw ValidationError("duplicate bot id " + std::to_string(config.id));
    }
}

BotRegistry::Entry* BotRegistry::find(BotId bot) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = bots_.find(bot);
    return it == bots_.end() ? nullptr : it->second.get();
}

bool BotRegistry::contains(BotId bot) const {
    return find(bot) != nullptr;
}

std::vector<BotId> BotRegistry::ids() const {
    std::vector<BotId> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(bots_.size());
        for (const auto& [id, entry] : bots_) {
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<config::BotConfig> BotRegistry::config(BotId bot) const {
    Entry* entry = find(bot);
    if (!entry) {
        return std::nullopt;
    }
    config::BotConfig cfg = entry->config;
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    cfg.status = entry->runtime.status;
    return cfg;
}

std::optional<BotRuntime> BotRegistry::runtime(BotId bot) const {
    Entry* entry = find(bot);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    return entry->runtime;
}

std::timed_mutex* BotRegistry::trade_lock(BotId bot) {
    Entry* entry = find(bot);
    return entry ? &entry->trade_lock : nullptr;
}

bool BotRegistry::update_runtime(BotId bot, const std::function<void(BotRuntime&)>& fn) {
    Entry* entry = find(bot);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->state_mutex);
    fn(entry->runtime);
    entry->runtime.current_position_size = std::max(0.0, entry->runtime.current_position_size);
    return true;
}

bool BotRegistry::set_status(BotId bot, BotStatus status) {
    return update_runtime(bot, [status](BotRuntime& rt) { rt.status = status; });
}

} // namespace tradebot::execution
