#include "Event.hpp"
#include <unordered_map>

namespace nearme {

std::string geofenceEventToString(GeofenceEvent event) {
    switch (event) {
        case GeofenceEvent::Enter: return "enter";
        case GeofenceEvent::Exit: return "exit";
        case GeofenceEvent::Dwell: return "dwell";
    }
    return "unknown";
}

std::string transitionKindToString(TransitionKind kind) {
    return kind == TransitionKind::Enter ? "enter" : "exit";
}

std::optional<TransitionKind> stringToTransitionKind(const std::string& str) {
    static const std::unordered_map<std::string, TransitionKind> kindMap = {
        {"enter", TransitionKind::Enter},
        {"exit", TransitionKind::Exit}
    };

    auto it = kindMap.find(str);
    if (it == kindMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransitionKind> toTransitionKind(GeofenceEvent event) {
    switch (event) {
        case GeofenceEvent::Enter: return TransitionKind::Enter;
        case GeofenceEvent::Exit: return TransitionKind::Exit;
        default: return std::nullopt;
    }
}

} // namespace nearme
