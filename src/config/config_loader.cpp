#include "../../include/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace tradebot::config {

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

template <typename T>
T get_or(const json& j, const char* key, T fallback, const std::string& where) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (const json::exception&) {
        throw ValidationError(where + ": field '" + key + "' has the wrong type");
    }
}

double get_number(const json& j, const char* key, double fallback, const std::string& where) {
    double v = get_or<double>(j, key, fallback, where);
    if (!std::isfinite(v)) {
        throw ValidationError(where + ": field '" + key + "' is not finite");
    }
    return v;
}

int get_int(const json& j, const char* key, int fallback, const std::string& where) {
    if (j.contains(key) && !j[key].is_null() && !j[key].is_number_integer()) {
        throw ValidationError(where + ": field '" + key + "' must be an integer");
    }
    return get_or<int>(j, key, fallback, where);
}

strategy::Temperature get_temperature(const json& j, const char* key, strategy::Temperature fallback,
                                      const std::string& where) {
    std::string name = get_or<std::string>(j, key, "", where);
    if (name.empty()) {
        return fallback;
    }
    strategy::Temperature t;
    if (!strategy::string_to_temperature(name, t)) {
        throw ValidationError(where + ": unknown temperature '" + name + "'");
    }
    return t;
}

void require_positive_period(int period, const char* field, const std::string& where) {
    if (period <= 0) {
        throw ValidationError(where + ": " + field + " must be positive");
    }
}

IndicatorParams parse_params(const std::string& type, const json& j, const std::string& where) {
    if (type == "rsi") {
        RsiConfig c;
        c.period = get_int(j, "period", c.period, where);
        // bot configs name the RSI levels buy/sell_threshold
        c.oversold = get_number(j, "oversold", get_number(j, "buy_threshold", c.oversold, where), where);
        c.overbought = get_number(j, "overbought", get_number(j, "sell_threshold", c.overbought, where), where);
        require_positive_period(c.period, "period", where);
        if (!(c.oversold > 0 && c.oversold < c.overbought && c.overbought < 100)) {
            throw ValidationError(where + ": RSI levels must satisfy 0 < oversold < overbought < 100");
        }
        return c;
    }
    if (type == "moving_average" || type == "ma" || type == "ma_crossover" || type == "sma") {
        MovingAverageConfig c;
        c.fast_period = get_int(j, "fast_period", c.fast_period, where);
        c.slow_period = get_int(j, "slow_period", c.slow_period, where);
        require_positive_period(c.fast_period, "fast_period", where);
        require_positive_period(c.slow_period, "slow_period", where);
        if (c.fast_period >= c.slow_period) {
            throw ValidationError(where + ": fast_period must be below slow_period");
        }
        return c;
    }
    if (type == "macd") {
        MacdConfig c;
        c.fast_period = get_int(j, "fast_period", c.fast_period, where);
        c.slow_period = get_int(j, "slow_period", c.slow_period, where);
        c.signal_period = get_int(j, "signal_period", c.signal_period, where);
        require_positive_period(c.fast_period, "fast_period", where);
        require_positive_period(c.slow_period, "slow_period", where);
        require_positive_period(c.signal_period, "signal_period", where);
        if (c.fast_period >= c.slow_period) {
            throw ValidationError(where + ": fast_period must be below slow_period");
        }
        return c;
    }
    throw ValidationError(where + ": unknown indicator type '" + type + "'");
}

} // namespace

IndicatorConfig parse_indicator(const std::string& key, const json& j) {
    const std::string where = "indicator '" + key + "'";
    if (!j.is_object()) {
        throw ValidationError(where + ": must be an object");
    }

    IndicatorConfig ind;
    ind.name = get_or<std::string>(j, "name", key, where);
    std::string type = lower(get_or<std::string>(j, "type", key, where));

    ind.enabled = get_or<bool>(j, "enabled", false, where);
    ind.weight = get_number(j, "weight", 0.0, where);
    if (ind.weight < 0) {
        throw ValidationError(where + ": weight must not be negative");
    }
    ind.params = parse_params(type, j, where);
    return ind;
}

std::vector<IndicatorConfig> parse_signal_config(const json& j) {
    std::vector<IndicatorConfig> out;
    if (j.is_null()) {
        return out;
    }

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            out.push_back(parse_indicator(it.key(), it.value()));
        }
    } else if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            const json& entry = j[i];
            if (!entry.is_object() || !entry.contains("type")) {
                throw ValidationError("signal_config[" + std::to_string(i) + "]: needs an object with 'type'");
            }
            out.push_back(parse_indicator(entry["type"].get<std::string>(), entry));
        }
    } else {
        throw ValidationError("signal_config must be an object or an array");
    }

    std::set<std::string> names;
    for (const auto& ind : out) {
        if (!names.insert(ind.name).second) {
            throw ValidationError("duplicate indicator name '" + ind.name + "'");
        }
    }
    return out;
}

BotConfig parse_bot_config(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("bot entry must be an object");
    }

    BotConfig bot;
    if (!j.contains("id") || !j["id"].is_number_unsigned() || j["id"].get<uint64_t>() == 0 ||
        j["id"].get<uint64_t>() > UINT32_MAX) {
        throw ValidationError("bot: 'id' must be a positive integer");
    }
    bot.id = j["id"].get<BotId>();
    const std::string where = "bot " + std::to_string(bot.id);

    bot.name = get_or<std::string>(j, "name", "bot-" + std::to_string(bot.id), where);
    bot.pair = get_or<std::string>(j, "pair", "", where);
    if (bot.pair.empty()) {
        throw ValidationError(where + ": 'pair' is required");
    }

    std::string status = get_or<std::string>(j, "status", "running", where);
    if (!string_to_bot_status(status, bot.status)) {
        throw ValidationError(where + ": unknown status '" + status + "'");
    }

    bot.buy_threshold = get_number(j, "buy_threshold", bot.buy_threshold, where);
    bot.sell_threshold = get_number(j, "sell_threshold", bot.sell_threshold, where);
    if (!(bot.buy_threshold < bot.sell_threshold) || bot.buy_threshold < -1 || bot.sell_threshold > 1) {
        throw ValidationError(where + ": thresholds must satisfy -1 <= buy_threshold < sell_threshold <= 1");
    }

    bot.confirmation_minutes = get_int(j, "confirmation_minutes", bot.confirmation_minutes, where);
    bot.cooldown_minutes = get_int(j, "cooldown_minutes", bot.cooldown_minutes, where);
    if (bot.confirmation_minutes < 0 || bot.cooldown_minutes < 0) {
        throw ValidationError(where + ": confirmation_minutes and cooldown_minutes must not be negative");
    }

    bot.base_position_size_usd = get_number(j, "position_size_usd", bot.base_position_size_usd, where);
    if (!(bot.base_position_size_usd > 0)) {
        throw ValidationError(where + ": position_size_usd must be positive");
    }
    bot.min_temperature_to_trade = get_temperature(j, "min_temperature", bot.min_temperature_to_trade, where);

    int granularity = get_int(j, "granularity_sec", static_cast<int>(bot.candle_granularity_sec), where);
    int limit = get_int(j, "candle_limit", static_cast<int>(bot.candle_limit), where);
    if (granularity <= 0 || limit <= 0) {
        throw ValidationError(where + ": granularity_sec and candle_limit must be positive");
    }
    bot.candle_granularity_sec = static_cast<uint32_t>(granularity);
    bot.candle_limit = static_cast<uint32_t>(limit);

    // Signal problems do not reject the bot; it loads and holds
    try {
        const json empty;
        bot.indicators = parse_signal_config(j.contains("signal_config") ? j["signal_config"] : empty);
    } catch (const ValidationError& e) {
        bot.indicators.clear();
        bot.config_error = e.what();
    } catch (const json::exception& e) {
        bot.indicators.clear();
        bot.config_error = e.what();
    }
    return bot;
}

risk::SafetyLimits parse_safety_limits(const json& j) {
    risk::SafetyLimits s;
    if (j.is_null()) {
        return s;
    }
    const std::string where = "safety";
    s.max_position_usd = get_number(j, "max_position_usd", s.max_position_usd, where);
    s.min_position_usd = get_number(j, "min_position_usd", s.min_position_usd, where);
    int max_trades = get_int(j, "max_daily_trades", static_cast<int>(s.max_daily_trades), where);
    if (max_trades < 0) {
        throw ValidationError("safety: max_daily_trades must not be negative");
    }
    s.max_daily_trades = static_cast<uint32_t>(max_trades);
    s.max_daily_loss_usd = get_number(j, "max_daily_loss_usd", s.max_daily_loss_usd, where);
    s.min_temperature = get_temperature(j, "min_temperature", s.min_temperature, where);

    if (s.min_position_usd < 0 || s.max_position_usd < s.min_position_usd) {
        throw ValidationError("safety: need 0 <= min_position_usd <= max_position_usd");
    }
    if (s.max_daily_loss_usd < 0) {
        throw ValidationError("safety: max_daily_loss_usd must not be negative");
    }
    return s;
}

trading::SizingConfig parse_sizing_config(const json& j) {
    trading::SizingConfig s;
    if (j.is_null()) {
        return s;
    }
    s.min_multiplier = get_number(j, "min_multiplier", s.min_multiplier, "sizing");
    s.max_multiplier = get_number(j, "max_multiplier", s.max_multiplier, "sizing");
    if (!(s.min_multiplier > 0) || s.max_multiplier < s.min_multiplier) {
        throw ValidationError("sizing: need 0 < min_multiplier <= max_multiplier");
    }
    return s;
}

::tradebot::execution::ExecutorConfig parse_executor_config(const json& j) {
    ::tradebot::execution::ExecutorConfig e;
    if (j.is_null()) {
        return e;
    }
    int timeout_ms = get_int(j, "lock_timeout_ms", static_cast<int>(e.lock_timeout.count()), "executor");
    if (timeout_ms < 0) {
        throw ValidationError("executor: lock_timeout_ms must not be negative");
    }
    e.lock_timeout = std::chrono::milliseconds(timeout_ms);
    e.stale_pending_minutes = get_int(j, "stale_pending_minutes", e.stale_pending_minutes, "executor");
    e.quantity_decimals = get_int(j, "quantity_decimals", e.quantity_decimals, "executor");
    if (e.quantity_decimals < 0 || e.quantity_decimals > 12) {
        throw ValidationError("executor: quantity_decimals must be within [0, 12]");
    }
    return e;
}

AppConfig parse_app_config(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("configuration root must be an object");
    }

    const json empty;
    AppConfig app;
    app.safety = parse_safety_limits(j.contains("safety") ? j["safety"] : empty);
    app.sizing = parse_sizing_config(j.contains("sizing") ? j["sizing"] : empty);
    app.executor = parse_executor_config(j.contains("executor") ? j["executor"] : empty);

    if (j.contains("bots")) {
        if (!j["bots"].is_array()) {
            throw ValidationError("'bots' must be an array");
        }
        std::set<BotId> ids;
        for (const auto& entry : j["bots"]) {
            BotConfig bot = parse_bot_config(entry);
            if (!ids.insert(bot.id).second) {
                throw ValidationError("duplicate bot id " + std::to_string(bot.id));
            }
            app.bots.push_back(std::move(bot));
        }
    }
    return app;
}

AppConfig load_config_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("configuration is not valid JSON: ") + e.what());
    }
    return parse_app_config(j);
}

AppConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_config_string(buffer.str());
}

} // namespace tradebot::config
