#pragma once

#include <string>
#include <optional>

namespace nearme {

/// Radius applied to targets that do not specify one
constexpr double kDefaultRadiusMeters = 200.0;

/// Joins id and display name inside a geofence key
constexpr const char* kGeofenceKeySeparator = "::";

/// Display name for target records without a name
constexpr const char* kDefaultTargetName = "Saved place";

/**
 * @brief A saved place to monitor
 *
 * Immutable once loaded. The geofence key embeds the name, so the name must
 * not contain kGeofenceKeySeparator.
 */
struct Target {
    std::string id;
    std::string name = kDefaultTargetName;
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> radiusMeters;

    double effectiveRadius() const;
    std::string geofenceKey() const;
};

std::string makeGeofenceKey(const std::string& id, const std::string& name);

/// Display name carried by a key; the whole key when there is no separator.
std::string geofenceNameFromKey(const std::string& key);

} // namespace nearme
