#pragma once

#include "evaluation.hpp"

#include <nlohmann/json.hpp>

namespace tradebot {
namespace strategy {

using json = nlohmann::json;

// nlohmann ADL serializers
void to_json(json& j, const SignalResult& signal);
void to_json(json& j, const ConfirmationStatus& status);
void to_json(json& j, const RegimeDescriptor& regime);
void to_json(json& j, const EvaluationResult& result);

// Compact snapshot stored on Trade::signal_scores
std::string signal_snapshot(const EvaluationResult& result);

} // namespace strategy

namespace trading {
void to_json(nlohmann::json& j, const SizingSnapshot& sizing);
} // namespace trading

} // namespace tradebot
