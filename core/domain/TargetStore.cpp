#include "TargetStore.hpp"
#include "../JsonCodec.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace nearme::domain {

TargetStore::TargetStore(std::string sourcePath)
    : sourcePath_(std::move(sourcePath)) {
}

const std::vector<Target>& TargetStore::load() {
    std::ifstream file(sourcePath_);
    if (!file.is_open()) {
        throw LoadError("cannot open " + sourcePath_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    targets_ = parse(buffer.str());
    return targets_;
}

std::vector<Target> TargetStore::parse(const std::string& json) {
    std::vector<Target> targets;
    try {
        targets = JsonCodec::parseTargets(json);
    } catch (const nlohmann::json::exception& e) {
        throw LoadError(std::string("invalid JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw LoadError(e.what());
    }

    validate(targets);
    return targets;
}

void TargetStore::validate(const std::vector<Target>& targets) {
    std::unordered_set<std::string> keys;

    for (const auto& target : targets) {
        const std::string where = "target '" + target.id + "'";

        if (target.id.empty()) {
            throw LoadError("target id must not be empty");
        }
        // Any ':' in the id would let the separator match early inside the key
        if (target.id.find(':') != std::string::npos) {
            throw LoadError(where + ": id must not contain ':'");
        }
        if (target.name.find(kGeofenceKeySeparator) != std::string::npos) {
            throw LoadError(where + ": name contains the key separator");
        }
        if (!std::isfinite(target.latitude) || target.latitude < -90.0 || target.latitude > 90.0) {
            throw LoadError(where + ": latitude out of range");
        }
        if (!std::isfinite(target.longitude) || target.longitude < -180.0 || target.longitude > 180.0) {
            throw LoadError(where + ": longitude out of range");
        }
        if (target.radiusMeters && (!std::isfinite(*target.radiusMeters) || *target.radiusMeters <= 0.0)) {
            throw LoadError(where + ": radiusMeters must be positive");
        }
        if (!keys.insert(target.geofenceKey()).second) {
            throw LoadError(where + ": duplicate geofence key " + target.geofenceKey());
        }
    }
}

} // namespace nearme::domain
