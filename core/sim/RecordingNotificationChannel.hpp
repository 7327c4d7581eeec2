#pragma once

#include "../ports/INotificationChannel.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nearme::sim {

struct ShownNotification {
    int id = 0;
    std::string title;
    std::string body;
};

/**
 * Notification tray stand-in. Keeps what is currently visible (one entry per
 * id, later shows replace earlier ones) and the full history of show() calls.
 */
class RecordingNotificationChannel : public ports::INotificationChannel {
public:
    RecordingNotificationChannel() = default;
    ~RecordingNotificationChannel() override = default;

    bool initialize(const ports::NotificationChannelSettings& settings) override;
    bool show(int id, const std::string& title, const std::string& body) override;

    void setPermitted(bool permitted);
    void setFailInitialize(bool fail);

    std::map<int, ShownNotification> visible() const;
    std::vector<ShownNotification> history() const;
    std::optional<ShownNotification> last() const;
    std::optional<ports::NotificationChannelSettings> settings() const;
    int initializeCount() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<int, ShownNotification> visible_;
    std::vector<ShownNotification> history_;
    std::optional<ports::NotificationChannelSettings> settings_;
    bool permitted_ = true;
    bool failInitialize_ = false;
    int initializeCount_ = 0;
};

} // namespace nearme::sim
