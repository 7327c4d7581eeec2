#pragma once

#include <string>

namespace nearme::ports {

enum class Permission {
    Location,
    LocationAlways,
    Notification
};

enum class PermissionStatus {
    Granted,
    Denied,
    PermanentlyDenied  ///< Only recoverable from the OS settings screen
};

inline std::string permissionToString(Permission permission) {
    switch (permission) {
        case Permission::Location: return "location";
        case Permission::LocationAlways: return "locationAlways";
        case Permission::Notification: return "notification";
    }
    return "unknown";
}

class IPermissionSubsystem {
public:
    virtual ~IPermissionSubsystem() = default;

    virtual PermissionStatus status(Permission permission) = 0;

    /// May show a system prompt
    virtual PermissionStatus request(Permission permission) = 0;

    virtual bool openAppSettings() = 0;
};

} // namespace nearme::ports
