#pragma once

#include <string>
#include <optional>

namespace nearme {

/// Signals the OS geofence service can report for a monitored region.
/// Only Enter and Exit are transitions; anything else is a lifecycle signal.
enum class GeofenceEvent {
    Enter,
    Exit,
    Dwell
};

enum class TransitionKind {
    Enter,
    Exit
};

struct TransitionEvent {
    std::string geofenceKey;
    TransitionKind kind = TransitionKind::Enter;
    std::string timestamp;  ///< ISO-8601 UTC, millisecond precision
};

std::string geofenceEventToString(GeofenceEvent event);
std::string transitionKindToString(TransitionKind kind);
std::optional<TransitionKind> stringToTransitionKind(const std::string& str);
std::optional<TransitionKind> toTransitionKind(GeofenceEvent event);

} // namespace nearme
