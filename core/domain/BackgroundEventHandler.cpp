#include "BackgroundEventHandler.hpp"
#include "../Target.hpp"
#include "../../crypto/NotificationId.hpp"
#include <iostream>

namespace nearme::domain {

BackgroundEventHandler::BackgroundEventHandler(std::shared_ptr<ports::INotificationChannel> notifications,
                                               std::shared_ptr<PortRegistry> registry,
                                               std::shared_ptr<IClock> clock,
                                               std::string relayPortName)
    : notifications_(notifications), registry_(registry),
      clock_(clock ? clock : std::shared_ptr<IClock>(std::make_shared<SystemClock>())),
      relayPortName_(std::move(relayPortName)) {
}

int BackgroundEventHandler::onTransition(const ports::GeofenceCallbackParams& params) {
    auto kind = toTransitionKind(params.event);
    if (!kind) {
        return 0;
    }

    auto port = registry_ ? registry_->lookupPortByName(relayPortName_) : nullptr;
    int handled = 0;

    for (const auto& key : params.geofenceKeys) {
        const std::string name = geofenceNameFromKey(key);

        bool shown = false;
        try {
            shown = notifications_ &&
                    notifications_->show(NotificationId::forTransition(key, *kind),
                                         titleFor(*kind, name), bodyFor(*kind));
        } catch (const std::exception& e) {
            std::cerr << "[Background] Notification failed for " << key << ": " << e.what() << std::endl;
        }
        if (!shown) {
            std::cerr << "[Background] Notification not shown for " << key << std::endl;
        }

        if (port) {
            try {
                TransitionEvent event{key, *kind, clock_->iso8601()};
                if (!port->send(event)) {
                    std::cerr << "[Background] Relay dropped " << key << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[Background] Relay failed for " << key << ": " << e.what() << std::endl;
            }
        }
        handled++;
    }

    return handled;
}

std::string BackgroundEventHandler::titleFor(TransitionKind kind, const std::string& name) {
    return (kind == TransitionKind::Enter ? "Entered: " : "Exited: ") + name;
}

std::string BackgroundEventHandler::bodyFor(TransitionKind kind) {
    return "Geofence " + transitionKindToString(kind) + " detected.";
}

ports::GeofenceCallback makeBackgroundEntryPoint(BackgroundBootstrap bootstrap) {
    return [bootstrap = std::move(bootstrap)](const ports::GeofenceCallbackParams& params) {
        try {
            auto channel = bootstrap.notificationFactory ? bootstrap.notificationFactory() : nullptr;
            if (channel && !channel->initialize(bootstrap.channelSettings)) {
                std::cerr << "[Background] Notification channel " << bootstrap.channelSettings.channelId
                          << " unavailable" << std::endl;
            }

            BackgroundEventHandler handler(channel, bootstrap.registry, bootstrap.clock,
                                           bootstrap.relayPortName);
            handler.onTransition(params);
        } catch (const std::exception& e) {
            std::cerr << "[Background] Geofence callback failed: " << e.what() << std::endl;
        }
    };
}

} // namespace nearme::domain
