#include "TrayNotificationChannel.hpp"
#include <QMetaObject>

namespace nearme {
namespace qt {

TrayNotificationChannel::TrayNotificationChannel(QSystemTrayIcon* trayIcon, ShownCallback onShown)
    : trayIcon_(trayIcon), onShown_(std::move(onShown)) {
}

bool TrayNotificationChannel::initialize(const ports::NotificationChannelSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    highImportance_ = settings.highImportance;
    return trayIcon_ && QSystemTrayIcon::isSystemTrayAvailable();
}

bool TrayNotificationChannel::show(int id, const std::string& title, const std::string& body) {
    QPointer<QSystemTrayIcon> tray;
    bool highImportance = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tray = trayIcon_;
        highImportance = highImportance_;
    }
    if (!tray) {
        return false;
    }

    const QString qTitle = QString::fromStdString(title);
    const QString qBody = QString::fromStdString(body);
    const auto icon = highImportance ? QSystemTrayIcon::Warning : QSystemTrayIcon::Information;
    auto onShown = onShown_;

    // Background callbacks may arrive off the GUI thread
    QMetaObject::invokeMethod(tray.data(), [tray, id, qTitle, qBody, icon, onShown]() {
        if (!tray) {
            return;
        }
        tray->showMessage(qTitle, qBody, icon);
        if (onShown) {
            onShown(id, qTitle, qBody);
        }
    }, Qt::QueuedConnection);
    return true;
}

} // namespace qt
} // namespace nearme
