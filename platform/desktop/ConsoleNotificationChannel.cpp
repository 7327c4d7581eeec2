#include "ConsoleNotificationChannel.hpp"
#include <iostream>

namespace nearme {

bool ConsoleNotificationChannel::initialize(const ports::NotificationChannelSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    channelName_ = settings.channelName;
    return true;
}

bool ConsoleNotificationChannel::show(int id, const std::string& title, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[Notify] " << (channelName_.empty() ? "" : channelName_ + " ") << "#" << id
              << " " << title << ": " << body << std::endl;
    return true;
}

} // namespace nearme
