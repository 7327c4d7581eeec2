#pragma once

#include "../Event.hpp"
#include <chrono>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace nearme::ports {

enum class GeofenceErrorCode {
    TooManyGeofences,
    InvalidRadius,
    InvalidKey,
    ServiceUnavailable,
    PermissionDenied,
    Unknown
};

inline std::string geofenceErrorCodeToString(GeofenceErrorCode code) {
    switch (code) {
        case GeofenceErrorCode::TooManyGeofences: return "tooManyGeofences";
        case GeofenceErrorCode::InvalidRadius: return "invalidRadius";
        case GeofenceErrorCode::InvalidKey: return "invalidKey";
        case GeofenceErrorCode::ServiceUnavailable: return "serviceUnavailable";
        case GeofenceErrorCode::PermissionDenied: return "permissionDenied";
        case GeofenceErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

class GeofenceServiceException : public std::runtime_error {
public:
    GeofenceServiceException(GeofenceErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    GeofenceErrorCode code() const { return code_; }

private:
    GeofenceErrorCode code_;
};

/// Delivery tuning passed through to the platform. Trades battery for latency.
struct PlatformHints {
    std::set<TransitionKind> initialTriggers{TransitionKind::Enter};
    std::chrono::seconds notificationResponsiveness{60};
    bool initialTriggerOnRegister = true;
};

struct GeofenceDescriptor {
    std::string key;
    double latitude = 0.0;
    double longitude = 0.0;
    double radiusMeters = 0.0;
    std::set<TransitionKind> triggers;
    PlatformHints hints;
};

struct GeofenceCallbackParams {
    std::vector<std::string> geofenceKeys;
    GeofenceEvent event = GeofenceEvent::Enter;
};

using GeofenceCallback = std::function<void(const GeofenceCallbackParams&)>;

/**
 * OS geofence monitoring primitive. The callback may run in a context with no
 * application state. Delivery is at-least-once.
 *
 * All operations throw GeofenceServiceException on failure.
 */
class IGeofenceService {
public:
    virtual ~IGeofenceService() = default;

    virtual void initialize() = 0;
    virtual void clearAll() = 0;

    /// Accepted registrations are persisted asynchronously; listActive() is authoritative.
    virtual void registerGeofence(const GeofenceDescriptor& descriptor, GeofenceCallback callback) = 0;

    virtual std::vector<std::string> listActive() const = 0;
};

} // namespace nearme::ports
