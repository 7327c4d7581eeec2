#include "Geo.hpp"
#include <cmath>
#include <algorithm>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace nearme {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon / 2) * std::sin(dLon / 2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return EARTH_RADIUS_METERS * c;
}

bool Geo::isInside(const Location& location, double centerLat, double centerLon,
                   double radiusMeters) {
    return distanceMeters(location.lat, location.lon, centerLat, centerLon) <= radiusMeters;
}

Location Geo::interpolateRoute(const std::vector<RoutePoint>& route, double progress) {
    Location loc;
    if (route.empty()) {
        return loc;
    }

    progress = std::clamp(progress, 0.0, 1.0);
    double scaled = progress * static_cast<double>(route.size() - 1);
    size_t segment = static_cast<size_t>(scaled);

    if (segment >= route.size() - 1) {
        loc.lat = route.back().lat;
        loc.lon = route.back().lon;
        return loc;
    }

    double local = scaled - static_cast<double>(segment);
    const auto& from = route[segment];
    const auto& to = route[segment + 1];
    loc.lat = from.lat + (to.lat - from.lat) * local;
    loc.lon = from.lon + (to.lon - from.lon) * local;
    return loc;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

} // namespace nearme
