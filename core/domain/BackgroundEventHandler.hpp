#pragma once

#include "../IClock.hpp"
#include "../ports/IGeofenceService.hpp"
#include "../ports/INotificationChannel.hpp"
#include "PortRegistry.hpp"
#include <functional>
#include <memory>
#include <string>

namespace nearme::domain {

/**
 * @brief Turns one geofence callback into notifications and relay messages
 *
 * Holds no state of its own between invocations and never touches foreground
 * objects. The only outbound path besides the notification is the port found
 * in the registry.
 */
class BackgroundEventHandler {
public:
    BackgroundEventHandler(std::shared_ptr<ports::INotificationChannel> notifications,
                           std::shared_ptr<PortRegistry> registry,
                           std::shared_ptr<IClock> clock,
                           std::string relayPortName = kGeofenceRelayPortName);

    /// Returns the number of transitions handled (0 for non-transition events)
    int onTransition(const ports::GeofenceCallbackParams& params);

    static std::string titleFor(TransitionKind kind, const std::string& name);
    static std::string bodyFor(TransitionKind kind);

private:
    std::shared_ptr<ports::INotificationChannel> notifications_;
    std::shared_ptr<PortRegistry> registry_;
    std::shared_ptr<IClock> clock_;
    std::string relayPortName_;
};

/// Everything a cold-started background invocation needs
struct BackgroundBootstrap {
    std::function<std::shared_ptr<ports::INotificationChannel>()> notificationFactory;
    std::shared_ptr<PortRegistry> registry;
    std::shared_ptr<IClock> clock;
    ports::NotificationChannelSettings channelSettings;
    std::string relayPortName = kGeofenceRelayPortName;
};

/// Callback handed to the geofence service. Exceptions never leave it.
ports::GeofenceCallback makeBackgroundEntryPoint(BackgroundBootstrap bootstrap);

} // namespace nearme::domain
