#include "Target.hpp"
#include <cstring>

namespace nearme {

double Target::effectiveRadius() const {
    return radiusMeters.value_or(kDefaultRadiusMeters);
}

std::string Target::geofenceKey() const {
    return makeGeofenceKey(id, name);
}

std::string makeGeofenceKey(const std::string& id, const std::string& name) {
    return id + kGeofenceKeySeparator + name;
}

std::string geofenceNameFromKey(const std::string& key) {
    size_t separatorPos = key.find(kGeofenceKeySeparator);
    if (separatorPos == std::string::npos) {
        return key;
    }
    return key.substr(separatorPos + std::strlen(kGeofenceKeySeparator));
}

} // namespace nearme
