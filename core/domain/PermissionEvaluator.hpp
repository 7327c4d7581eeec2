#pragma once

#include "../ports/IPermissionSubsystem.hpp"
#include "../ports/ILocationProvider.hpp"
#include <memory>
#include <optional>
#include <string>

namespace nearme::domain {

struct PermissionSnapshot {
    bool locationServiceEnabled = false;
    bool locationGranted = false;
    bool alwaysGranted = false;
    bool notificationsGranted = false;
    bool preciseLocation = false;
    bool needsManualSettings = false;

    /// Set only where the platform distinguishes precise from reduced accuracy
    std::optional<ports::LocationAccuracyStatus> accuracyStatus;
};

/**
 * @brief Reduces the layered permission model to one snapshot
 *
 * Order: location service, location, always, accuracy, notifications.
 * Each missing permission is requested once. A platform call that throws
 * counts as "not granted" and never aborts the evaluation.
 */
class PermissionEvaluator {
public:
    PermissionEvaluator(std::shared_ptr<ports::IPermissionSubsystem> permissions,
                        std::shared_ptr<ports::ILocationProvider> location);

    PermissionSnapshot evaluate();

    bool openSettings();

    static std::string describe(const PermissionSnapshot& snapshot);

private:
    ports::PermissionStatus ensure(ports::Permission permission);
    ports::PermissionStatus query(ports::Permission permission, bool prompt);
    bool locationServiceEnabled() const;
    std::optional<ports::LocationAccuracyStatus> readAccuracy() const;

    std::shared_ptr<ports::IPermissionSubsystem> permissions_;
    std::shared_ptr<ports::ILocationProvider> location_;
};

} // namespace nearme::domain
