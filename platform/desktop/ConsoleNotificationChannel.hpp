#pragma once

#include "../../core/ports/INotificationChannel.hpp"
#include <mutex>
#include <string>

namespace nearme {

/// Prints notifications to stdout. Used by the CLI in place of a system tray.
class ConsoleNotificationChannel : public ports::INotificationChannel {
public:
    bool initialize(const ports::NotificationChannelSettings& settings) override;
    bool show(int id, const std::string& title, const std::string& body) override;

private:
    std::mutex mutex_;
    std::string channelName_;
};

} // namespace nearme
