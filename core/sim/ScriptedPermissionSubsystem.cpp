#include "ScriptedPermissionSubsystem.hpp"
#include <stdexcept>

namespace nearme::sim {

using ports::Permission;
using ports::PermissionStatus;

ScriptedPermissionSubsystem::ScriptedPermissionSubsystem() {
    for (auto permission : {Permission::Location, Permission::LocationAlways, Permission::Notification}) {
        statuses_[permission] = PermissionStatus::Granted;
    }
}

PermissionStatus ScriptedPermissionSubsystem::status(Permission permission) {
    statusChecks_[permission]++;
    throwIfFailing(permission);
    return statuses_[permission];
}

PermissionStatus ScriptedPermissionSubsystem::request(Permission permission) {
    requests_[permission]++;
    throwIfFailing(permission);

    auto outcome = requestOutcomes_.find(permission);
    if (outcome != requestOutcomes_.end()) {
        statuses_[permission] = outcome->second;
    }
    return statuses_[permission];
}

bool ScriptedPermissionSubsystem::openAppSettings() {
    settingsOpened_++;
    return true;
}

void ScriptedPermissionSubsystem::setStatus(Permission permission, PermissionStatus status) {
    statuses_[permission] = status;
}

void ScriptedPermissionSubsystem::setRequestOutcome(Permission permission, PermissionStatus outcome) {
    requestOutcomes_[permission] = outcome;
}

void ScriptedPermissionSubsystem::setFailing(Permission permission, bool failing) {
    if (failing) {
        failing_.insert(permission);
    } else {
        failing_.erase(permission);
    }
}

void ScriptedPermissionSubsystem::denyAll() {
    for (auto& entry : statuses_) {
        entry.second = PermissionStatus::Denied;
    }
}

int ScriptedPermissionSubsystem::statusChecks(Permission permission) const {
    auto it = statusChecks_.find(permission);
    return it != statusChecks_.end() ? it->second : 0;
}

int ScriptedPermissionSubsystem::requests(Permission permission) const {
    auto it = requests_.find(permission);
    return it != requests_.end() ? it->second : 0;
}

void ScriptedPermissionSubsystem::throwIfFailing(Permission permission) const {
    if (failing_.count(permission) > 0) {
        throw std::runtime_error("platform error querying " + ports::permissionToString(permission));
    }
}

} // namespace nearme::sim
