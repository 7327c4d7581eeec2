#include "SimulatedGeofenceService.hpp"
#include <cmath>

namespace nearme::sim {

using ports::GeofenceErrorCode;
using ports::GeofenceServiceException;

SimulatedGeofenceService::SimulatedGeofenceService(std::size_t capacity)
    : capacity_(capacity) {
}

void SimulatedGeofenceService::initialize() {
    callLog_.push_back("initialize");
    initializeCount_++;
    checkAvailable();
    initialized_ = true;
}

void SimulatedGeofenceService::clearAll() {
    callLog_.push_back("clearAll");
    clearCount_++;
    checkAvailable();
    if (failClear_) {
        throw GeofenceServiceException(*failClear_, "clearAll rejected");
    }
    registrations_.clear();
}

void SimulatedGeofenceService::registerGeofence(const ports::GeofenceDescriptor& descriptor,
                                                ports::GeofenceCallback callback) {
    callLog_.push_back("register:" + descriptor.key);
    registerCount_++;
    checkAvailable();

    auto rejected = rejected_.find(descriptor.key);
    if (rejected != rejected_.end()) {
        throw GeofenceServiceException(rejected->second, "rejected " + descriptor.key);
    }
    if (descriptor.key.empty()) {
        throw GeofenceServiceException(GeofenceErrorCode::InvalidKey, "empty geofence key");
    }
    if (!std::isfinite(descriptor.radiusMeters) || descriptor.radiusMeters <= 0.0) {
        throw GeofenceServiceException(GeofenceErrorCode::InvalidRadius,
                                       "radius must be positive for " + descriptor.key);
    }
    if (registrations_.count(descriptor.key) == 0 && registrations_.size() >= capacity_) {
        throw GeofenceServiceException(GeofenceErrorCode::TooManyGeofences,
                                       "limit of " + std::to_string(capacity_) + " geofences reached");
    }
    if (dropped_.count(descriptor.key) > 0) {
        return;
    }

    auto& registration = registrations_[descriptor.key];
    registration.descriptor = descriptor;
    registration.callback = std::move(callback);
    registration.inside.reset();

    if (!position_) {
        return;
    }

    bool inside = contains(registration, *position_);
    registration.inside = inside;

    const auto& hints = descriptor.hints;
    auto kind = inside ? TransitionKind::Enter : TransitionKind::Exit;
    if (hints.initialTriggerOnRegister && hints.initialTriggers.count(kind) > 0) {
        deliver(registration.callback,
                {{descriptor.key}, inside ? GeofenceEvent::Enter : GeofenceEvent::Exit});
    }
}

std::vector<std::string> SimulatedGeofenceService::listActive() const {
    callLog_.push_back("listActive");
    listCount_++;
    checkAvailable();
    if (failList_) {
        throw GeofenceServiceException(*failList_, "listActive rejected");
    }

    std::vector<std::string> keys;
    keys.reserve(registrations_.size());
    for (const auto& [key, registration] : registrations_) {
        keys.push_back(key);
    }
    return keys;
}

void SimulatedGeofenceService::updatePosition(const Location& position) {
    position_ = position;

    // Collect first: a callback may re-register and invalidate iterators
    std::vector<std::pair<std::string, GeofenceEvent>> changes;
    for (auto& [key, registration] : registrations_) {
        bool inside = contains(registration, position);
        bool wasInside = registration.inside.value_or(false);
        bool known = registration.inside.has_value();
        registration.inside = inside;

        if (known && inside == wasInside) {
            continue;
        }
        if (!known && !inside) {
            continue;
        }

        auto kind = inside ? TransitionKind::Enter : TransitionKind::Exit;
        if (registration.descriptor.triggers.count(kind) > 0) {
            changes.emplace_back(key, inside ? GeofenceEvent::Enter : GeofenceEvent::Exit);
        }
    }

    for (const auto& [key, event] : changes) {
        auto it = registrations_.find(key);
        if (it != registrations_.end()) {
            deliver(it->second.callback, {{key}, event});
        }
    }
}

void SimulatedGeofenceService::fire(const std::vector<std::string>& keys, GeofenceEvent event) {
    ports::GeofenceCallback callback;
    std::vector<std::string> delivered;
    for (const auto& key : keys) {
        auto it = registrations_.find(key);
        if (it == registrations_.end()) {
            continue;
        }
        if (!callback) {
            callback = it->second.callback;
        }
        delivered.push_back(key);
    }

    if (callback && !delivered.empty()) {
        deliver(callback, {delivered, event});
    }
}

bool SimulatedGeofenceService::redeliver() {
    if (!lastCallback_) {
        return false;
    }
    deliver(lastCallback_, lastParams_);
    return true;
}

void SimulatedGeofenceService::rejectKey(const std::string& key, GeofenceErrorCode code) {
    rejected_[key] = code;
}

void SimulatedGeofenceService::dropKey(const std::string& key) {
    dropped_.insert(key);
}

std::optional<ports::GeofenceDescriptor> SimulatedGeofenceService::descriptor(const std::string& key) const {
    auto it = registrations_.find(key);
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second.descriptor;
}

void SimulatedGeofenceService::resetCallLog() {
    callLog_.clear();
    initializeCount_ = 0;
    clearCount_ = 0;
    registerCount_ = 0;
    listCount_ = 0;
}

void SimulatedGeofenceService::checkAvailable() const {
    if (unavailable_) {
        throw GeofenceServiceException(GeofenceErrorCode::ServiceUnavailable, "geofence service unavailable");
    }
}

bool SimulatedGeofenceService::contains(const Registration& registration, const Location& position) const {
    const auto& d = registration.descriptor;
    return Geo::isInside(position, d.latitude, d.longitude, d.radiusMeters);
}

void SimulatedGeofenceService::deliver(ports::GeofenceCallback callback,
                                       ports::GeofenceCallbackParams params) {
    lastCallback_ = callback;
    lastParams_ = params;
    deliveries_++;
    if (callback) {
        callback(params);
    }
}

} // namespace nearme::sim
