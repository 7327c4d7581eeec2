#pragma once

#include "../core/Event.hpp"
#include <string>

namespace nearme {

/**
 * @brief Stable notification ids for geofence transitions
 *
 * The id depends only on (key, kind), so a redelivered transition replaces
 * the visible notification instead of stacking a second one. Ids are stable
 * across processes and runs.
 */
class NotificationId {
public:
    static int forTransition(const std::string& geofenceKey, TransitionKind kind);

private:
    static std::string sha256(const std::string& message);
};

} // namespace nearme
