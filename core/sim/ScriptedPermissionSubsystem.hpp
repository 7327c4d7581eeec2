#pragma once

#include "../ports/IPermissionSubsystem.hpp"
#include <map>
#include <optional>
#include <set>

namespace nearme::sim {

/**
 * Permission subsystem driven by a script. Each permission has a current
 * status and an optional outcome for the next request(); without one a
 * request leaves the status unchanged, like a dismissed prompt.
 */
class ScriptedPermissionSubsystem : public ports::IPermissionSubsystem {
public:
    /// Everything granted unless scripted otherwise
    ScriptedPermissionSubsystem();
    ~ScriptedPermissionSubsystem() override = default;

    ports::PermissionStatus status(ports::Permission permission) override;
    ports::PermissionStatus request(ports::Permission permission) override;
    bool openAppSettings() override;

    void setStatus(ports::Permission permission, ports::PermissionStatus status);
    void setRequestOutcome(ports::Permission permission, ports::PermissionStatus outcome);
    /// Every call for the permission throws std::runtime_error
    void setFailing(ports::Permission permission, bool failing);
    void denyAll();

    int statusChecks(ports::Permission permission) const;
    int requests(ports::Permission permission) const;
    int settingsOpened() const { return settingsOpened_; }

private:
    void throwIfFailing(ports::Permission permission) const;

    std::map<ports::Permission, ports::PermissionStatus> statuses_;
    std::map<ports::Permission, ports::PermissionStatus> requestOutcomes_;
    std::set<ports::Permission> failing_;
    std::map<ports::Permission, int> statusChecks_;
    std::map<ports::Permission, int> requests_;
    int settingsOpened_ = 0;
};

} // namespace nearme::sim
