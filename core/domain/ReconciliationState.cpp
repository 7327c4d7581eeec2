#include "ReconciliationState.hpp"

namespace nearme::domain {

void ReconciliationState::applyTransition(const TransitionEvent& event) {
    auto& entry = insideState_[event.geofenceKey];
    entry.inside = event.kind == TransitionKind::Enter;
    entry.lastEvent = LastTransition{event.kind, event.timestamp};
    lastEvent_ = event;
}

bool ReconciliationState::isInside(const std::string& geofenceKey) const {
    auto it = insideState_.find(geofenceKey);
    return it != insideState_.end() && it->second.inside;
}

std::optional<InsideEntry> ReconciliationState::entry(const std::string& geofenceKey) const {
    auto it = insideState_.find(geofenceKey);
    if (it == insideState_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ReconciliationState::lastEventSummary() const {
    if (!lastEvent_) {
        return "None";
    }

    std::string summary = transitionKindToString(lastEvent_->kind) + ": " +
                          geofenceNameFromKey(lastEvent_->geofenceKey);
    if (!lastEvent_->timestamp.empty()) {
        summary += " @ " + lastEvent_->timestamp;
    }
    return summary;
}

double ReconciliationState::distanceTo(const Target& target, const Location& position) {
    return Geo::distanceMeters(position.lat, position.lon, target.latitude, target.longitude);
}

} // namespace nearme::domain
