#pragma once

#include "../../core/ports/INotificationChannel.hpp"
#include <QPointer>
#include <QSystemTrayIcon>
#include <functional>
#include <mutex>

namespace nearme {
namespace qt {

/**
 * Shows notifications as system tray balloons. Later messages replace the
 * current balloon, so an id shown twice never stacks.
 */
class TrayNotificationChannel : public ports::INotificationChannel {
public:
    using ShownCallback = std::function<void(int id, const QString& title, const QString& body)>;

    explicit TrayNotificationChannel(QSystemTrayIcon* trayIcon, ShownCallback onShown = nullptr);

    bool initialize(const ports::NotificationChannelSettings& settings) override;
    bool show(int id, const std::string& title, const std::string& body) override;

private:
    QPointer<QSystemTrayIcon> trayIcon_;
    ShownCallback onShown_;
    std::mutex mutex_;
    bool highImportance_ = true;
};

} // namespace qt
} // namespace nearme
