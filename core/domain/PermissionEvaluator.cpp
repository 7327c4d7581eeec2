#include "PermissionEvaluator.hpp"
#include <iostream>

namespace nearme::domain {

using ports::Permission;
using ports::PermissionStatus;

PermissionEvaluator::PermissionEvaluator(std::shared_ptr<ports::IPermissionSubsystem> permissions,
                                         std::shared_ptr<ports::ILocationProvider> location)
    : permissions_(permissions), location_(location) {
}

PermissionSnapshot PermissionEvaluator::evaluate() {
    PermissionSnapshot snapshot;

    // A disabled location service cannot be requested around
    if (!locationServiceEnabled()) {
        return snapshot;
    }
    snapshot.locationServiceEnabled = true;

    auto locationStatus = ensure(Permission::Location);
    if (locationStatus != PermissionStatus::Granted) {
        snapshot.needsManualSettings = locationStatus == PermissionStatus::PermanentlyDenied;
        return snapshot;
    }
    snapshot.locationGranted = true;

    // Foreground-only monitoring still works without "always"
    auto alwaysStatus = ensure(Permission::LocationAlways);
    snapshot.alwaysGranted = alwaysStatus == PermissionStatus::Granted;

    snapshot.accuracyStatus = readAccuracy();
    snapshot.preciseLocation = !snapshot.accuracyStatus ||
                               *snapshot.accuracyStatus == ports::LocationAccuracyStatus::Precise;

    auto notificationStatus = ensure(Permission::Notification);
    snapshot.notificationsGranted = notificationStatus == PermissionStatus::Granted;

    snapshot.needsManualSettings = locationStatus == PermissionStatus::PermanentlyDenied ||
                                   alwaysStatus == PermissionStatus::PermanentlyDenied ||
                                   notificationStatus == PermissionStatus::PermanentlyDenied ||
                                   !snapshot.preciseLocation;
    return snapshot;
}

bool PermissionEvaluator::openSettings() {
    try {
        return permissions_->openAppSettings();
    } catch (const std::exception& e) {
        std::cerr << "[Permissions] Cannot open settings: " << e.what() << std::endl;
        return false;
    }
}

std::string PermissionEvaluator::describe(const PermissionSnapshot& snapshot) {
    if (!snapshot.locationServiceEnabled) {
        return "Location services disabled";
    }
    if (!snapshot.locationGranted) {
        return "Location permission denied.";
    }

    std::string text = snapshot.alwaysGranted ? "Location: always" : "Location: while in use";
    text += " • ";
    text += snapshot.notificationsGranted ? "Notifications: granted" : "Notifications: denied";
    return text;
}

PermissionStatus PermissionEvaluator::ensure(Permission permission) {
    auto status = query(permission, false);
    if (status == PermissionStatus::Granted) {
        return status;
    }
    return query(permission, true);
}

PermissionStatus PermissionEvaluator::query(Permission permission, bool prompt) {
    try {
        return prompt ? permissions_->request(permission) : permissions_->status(permission);
    } catch (const std::exception& e) {
        std::cerr << "[Permissions] " << (prompt ? "Request" : "Status check") << " for "
                  << ports::permissionToString(permission) << " failed: " << e.what() << std::endl;
        return PermissionStatus::Denied;
    }
}

bool PermissionEvaluator::locationServiceEnabled() const {
    try {
        return location_->isLocationServiceEnabled();
    } catch (const std::exception& e) {
        std::cerr << "[Permissions] Location service check failed: " << e.what() << std::endl;
        return false;
    }
}

std::optional<ports::LocationAccuracyStatus> PermissionEvaluator::readAccuracy() const {
    try {
        if (!location_->supportsAccuracyStatus()) {
            return std::nullopt;
        }
        return location_->accuracyStatus();
    } catch (const std::exception& e) {
        std::cerr << "[Permissions] Accuracy check failed: " << e.what() << std::endl;
        return ports::LocationAccuracyStatus::Reduced;
    }
}

} // namespace nearme::domain
