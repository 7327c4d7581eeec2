#pragma once

#include "Event.hpp"
#include "Target.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace nearme {

/**
 * @brief JSON mapping for target lists and relay messages
 *
 * Target parsing is strict: a record with a missing or mistyped field throws
 * std::invalid_argument naming the field. Relay decoding is lenient and
 * returns nullopt for anything that is not a well-formed transition.
 */
class JsonCodec {
public:
    static std::vector<Target> parseTargets(const std::string& json);

    static Target jsonToTarget(const nlohmann::json& json);

    static std::string encodeTransition(const TransitionEvent& event);
    static std::optional<TransitionEvent> decodeTransition(const std::string& payload);

    static nlohmann::json transitionToJson(const TransitionEvent& event);
    static std::optional<TransitionEvent> jsonToTransition(const nlohmann::json& json);
};

} // namespace nearme
