#include "../../include/strategy/evaluation_json.hpp"

namespace tradebot {

namespace trading {

void to_json(nlohmann::json& j, const SizingSnapshot& s) {
    j = nlohmann::json{{"base_size_usd", s.base_size_usd},
                       {"regime", strategy::regime_to_string(s.regime)},
                       {"regime_multiplier", s.regime_multiplier},
                       {"weighted_volatility", s.weighted_volatility},
                       {"volatility_multiplier", s.volatility_multiplier},
                       {"signal_confidence", s.signal_confidence},
                       {"confidence_multiplier", s.confidence_multiplier},
                       {"raw_multiplier", s.raw_multiplier},
                       {"final_multiplier", s.final_multiplier},
                       {"final_size_usd", s.final_size_usd},
                       {"multiplier_clamped", s.multiplier_clamped},
                       {"size_clamped", s.size_clamped}};
}

} // namespace trading

namespace strategy {

void to_json(json& j, const SignalResult& signal) {
    j = json{{"name", signal.name},
             {"score", signal.score},
             {"action", action_to_string(signal.action)},
             {"confidence", signal.confidence}};
    if (signal.insufficient_data) {
        j["insufficient_data"] = true;
    }
    if (!signal.metadata.empty()) {
        j["metadata"] = signal.metadata;
    }
}

void to_json(json& j, const ConfirmationStatus& status) {
    j = json{{"state", confirmation_state_to_string(status.state)},
             {"action", action_to_string(status.action)},
             {"is_confirmed", status.is_confirmed},
             {"needs_confirmation", status.needs_confirmation},
             {"progress", status.progress},
             {"time_remaining_minutes", status.time_remaining_minutes}};
    if (status.confirmation_start != NO_TIMESTAMP) {
        j["confirmation_start_ns"] = status.confirmation_start;
    } else {
        j["confirmation_start_ns"] = nullptr;
    }
}

void to_json(json& j, const RegimeDescriptor& regime) {
    j = json{{"category", regime_to_string(classify_regime(regime))},
             {"trend_strength", regime.trend_strength},
             {"confidence", regime.confidence},
             {"volatility", {regime.short_volatility, regime.medium_volatility, regime.long_volatility}}};
}

void to_json(json& j, const EvaluationResult& r) {
    j = json{{"bot_id", r.bot_id},
             {"pair", r.pair},
             {"overall_score", r.overall_score},
             {"action", action_to_string(r.action)},
             {"confidence", r.confidence},
             {"temperature", temperature_to_string(r.temperature)},
             {"signals", r.signals},
             {"confirmation", r.confirmation},
             {"regime", r.regime},
             {"sizing", r.sizing},
             {"price", r.price},
             {"timestamp_ns", r.timestamp}};
    if (r.has_error()) {
        j["error"] = r.error;
    }
}

std::string signal_snapshot(const EvaluationResult& result) {
    json signals = json::object();
    for (const auto& s : result.signals) {
        signals[s.name] = json{{"score", s.score}, {"action", action_to_string(s.action)}};
    }
    json snapshot{{"overall_score", result.overall_score},
                  {"confidence", result.confidence},
                  {"temperature", temperature_to_string(result.temperature)},
                  {"signals", signals}};
    return snapshot.dump();
}

} // namespace strategy
} // namespace tradebot
