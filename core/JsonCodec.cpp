#include "JsonCodec.hpp"
#include <stdexcept>

namespace nearme {

std::vector<Target> JsonCodec::parseTargets(const std::string& json) {
    auto document = nlohmann::json::parse(json);
    if (!document.is_array()) {
        throw std::invalid_argument("target list must be a JSON array");
    }

    std::vector<Target> targets;
    targets.reserve(document.size());
    for (size_t i = 0; i < document.size(); ++i) {
        try {
            targets.push_back(jsonToTarget(document[i]));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("record " + std::to_string(i) + ": " + e.what());
        }
    }
    return targets;
}

Target JsonCodec::jsonToTarget(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("expected an object");
    }

    Target target;

    auto id = json.find("id");
    if (id == json.end() || !id->is_string()) {
        throw std::invalid_argument("'id' must be a string");
    }
    target.id = id->get<std::string>();

    auto name = json.find("name");
    if (name != json.end() && !name->is_null()) {
        if (!name->is_string()) {
            throw std::invalid_argument("'name' must be a string");
        }
        target.name = name->get<std::string>();
    }

    auto lat = json.find("latitude");
    if (lat == json.end() || !lat->is_number()) {
        throw std::invalid_argument("'latitude' must be a number");
    }
    target.latitude = lat->get<double>();

    auto lon = json.find("longitude");
    if (lon == json.end() || !lon->is_number()) {
        throw std::invalid_argument("'longitude' must be a number");
    }
    target.longitude = lon->get<double>();

    auto radius = json.find("radiusMeters");
    if (radius != json.end() && !radius->is_null()) {
        if (!radius->is_number()) {
            throw std::invalid_argument("'radiusMeters' must be a number");
        }
        target.radiusMeters = radius->get<double>();
    }

    return target;
}

std::string JsonCodec::encodeTransition(const TransitionEvent& event) {
    return transitionToJson(event).dump();
}

std::optional<TransitionEvent> JsonCodec::decodeTransition(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return jsonToTransition(json);
}

nlohmann::json JsonCodec::transitionToJson(const TransitionEvent& event) {
    nlohmann::json j;
    j["id"] = event.geofenceKey;
    j["event"] = transitionKindToString(event.kind);
    j["timestamp"] = event.timestamp;
    return j;
}

std::optional<TransitionEvent> JsonCodec::jsonToTransition(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    auto id = json.find("id");
    auto kind = json.find("event");
    if (id == json.end() || !id->is_string() || kind == json.end() || !kind->is_string()) {
        return std::nullopt;
    }

    auto parsedKind = stringToTransitionKind(kind->get<std::string>());
    if (!parsedKind) {
        return std::nullopt;
    }

    TransitionEvent event;
    event.geofenceKey = id->get<std::string>();
    event.kind = *parsedKind;
    auto timestamp = json.find("timestamp");
    if (timestamp != json.end() && timestamp->is_string()) {
        event.timestamp = timestamp->get<std::string>();
    }
    return event;
}

} // namespace nearme
