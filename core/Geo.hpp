#pragma once

#include <vector>

namespace nearme {

struct Location {
    double lat = 0.0;
    double lon = 0.0;
    double accuracy = 0.0;
};

struct RoutePoint {
    double lat = 0.0;
    double lon = 0.0;
};

class Geo {
public:
    /// Great-circle distance (haversine)
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);

    static bool isInside(const Location& location, double centerLat, double centerLon,
                         double radiusMeters);

    static Location interpolateRoute(const std::vector<RoutePoint>& route, double progress);

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
};

} // namespace nearme
