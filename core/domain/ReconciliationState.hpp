#pragma once

#include "../Event.hpp"
#include "../Geo.hpp"
#include "../Target.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace nearme::domain {

struct LastTransition {
    TransitionKind kind = TransitionKind::Enter;
    std::string timestamp;
};

struct InsideEntry {
    bool inside = false;
    std::optional<LastTransition> lastEvent;
};

/**
 * Foreground-only inside/outside map. Only relayed transitions change it;
 * live distance is display information and never flips the flag.
 * Arrival order wins: a late, older event overwrites a newer one.
 */
class ReconciliationState {
public:
    void applyTransition(const TransitionEvent& event);

    bool isInside(const std::string& geofenceKey) const;
    std::optional<InsideEntry> entry(const std::string& geofenceKey) const;
    const std::unordered_map<std::string, InsideEntry>& entries() const { return insideState_; }

    const std::optional<TransitionEvent>& lastEvent() const { return lastEvent_; }
    std::string lastEventSummary() const;

    static double distanceTo(const Target& target, const Location& position);

private:
    std::unordered_map<std::string, InsideEntry> insideState_;
    std::optional<TransitionEvent> lastEvent_;
};

} // namespace nearme::domain
