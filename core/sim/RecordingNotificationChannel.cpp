#include "RecordingNotificationChannel.hpp"

namespace nearme::sim {

bool RecordingNotificationChannel::initialize(const ports::NotificationChannelSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    initializeCount_++;
    if (failInitialize_) {
        return false;
    }
    settings_ = settings;
    return true;
}

bool RecordingNotificationChannel::show(int id, const std::string& title, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!permitted_) {
        return false;
    }

    ShownNotification notification{id, title, body};
    visible_[id] = notification;
    history_.push_back(notification);
    return true;
}

void RecordingNotificationChannel::setPermitted(bool permitted) {
    std::lock_guard<std::mutex> lock(mutex_);
    permitted_ = permitted;
}

void RecordingNotificationChannel::setFailInitialize(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failInitialize_ = fail;
}

std::map<int, ShownNotification> RecordingNotificationChannel::visible() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visible_;
}

std::vector<ShownNotification> RecordingNotificationChannel::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::optional<ShownNotification> RecordingNotificationChannel::last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back();
}

std::optional<ports::NotificationChannelSettings> RecordingNotificationChannel::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

int RecordingNotificationChannel::initializeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initializeCount_;
}

void RecordingNotificationChannel::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    visible_.clear();
    history_.clear();
}

} // namespace nearme::sim
