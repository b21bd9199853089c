#pragma once

#include "../config/bot_config.hpp"
#include "../types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace tradebot {
namespace execution {

/**
 * Mutable per-bot state
 */
struct BotRuntime {
    BotStatus status = BotStatus::Running;
    double current_position_size = 0; // USD, never negative
    double current_combined_score = 0;
    Timestamp last_evaluated_at = NO_TIMESTAMP;
};

/**
 * BotRegistry - bot configs, runtime state and per-bot trade locks
 *
 * Entries are added at startup and never removed (a bot is retired by
 * status), so references handed out stay valid for the registry's life.
 * Each bot has:
 *   - state_mutex: short lock around BotRuntime reads/writes
 *   - trade_lock: timed mutex held for the whole execute_trade
 *     read-check-act sequence
 */
class BotRegistry {
public:
    BotRegistry() = default;

    BotRegistry(const BotRegistry&) = delete;
    BotRegistry& operator=(const BotRegistry&) = delete;

    // Throws ValidationError for an invalid or duplicate id
    void add(const config::BotConfig& config);

    bool contains(BotId bot) const;
    std::vector<BotId> ids() const;

    std::optional<config::BotConfig> config(BotId bot) const;
    std::optional<BotRuntime> runtime(BotId bot) const;

    // nullptr for unknown bots
    std::timed_mutex* trade_lock(BotId bot);

    // Runs fn under the bot's state mutex; false if the bot is unknown
    bool update_runtime(BotId bot, const std::function<void(BotRuntime&)>& fn);

    bool set_status(BotId bot, BotStatus status);

private:
    struct Entry {
        config::BotConfig config;
        mutable std::mutex state_mutex;
        BotRuntime runtime;
        std::timed_mutex trade_lock;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<BotId, std::unique_ptr<Entry>> bots_;

    Entry* find(BotId bot) const;
};

} // namespace execution
} // namespace tradebot
