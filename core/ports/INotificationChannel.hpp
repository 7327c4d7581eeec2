#pragma once

#include <string>

namespace nearme::ports {

struct NotificationChannelSettings {
    std::string channelId = "nearby_alerts";
    std::string channelName = "Nearby Alerts";
    std::string description = "Alerts when you are close to a saved location.";
    bool highImportance = true;
    bool playSound = true;
};

class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    virtual bool initialize(const NotificationChannelSettings& settings) = 0;

    /// Showing an id that is already visible replaces that notification.
    virtual bool show(int id, const std::string& title, const std::string& body) = 0;
};

} // namespace nearme::ports
