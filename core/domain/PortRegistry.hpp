#pragma once

#include "../ports/ISendPort.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nearme::domain {

/// Well-known name the foreground registers its relay port under
constexpr const char* kGeofenceRelayPortName = "nearme_geofence_port";

/**
 * @brief Process-wide, string-keyed registry of relay send ports
 *
 * Hands the foreground's sending capability to a background invocation that
 * shares no other state with it. Passed explicitly to whoever needs it.
 */
class PortRegistry {
public:
    /// Replaces any existing mapping. Returns true if one was replaced.
    bool registerPortWithName(std::shared_ptr<ports::ISendPort> port, const std::string& name);

    bool removePortNameMapping(const std::string& name);

    /// nullptr when nothing is registered under the name
    std::shared_ptr<ports::ISendPort> lookupPortByName(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ports::ISendPort>> ports_;
};

} // namespace nearme::domain
