#pragma once

#include <QMainWindow>
#include <QTimer>
#include <QTextEdit>
#include <QPushButton>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QListWidget>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QSystemTrayIcon>

#include "../../platform/desktop/DesktopRuntime.hpp"
#include <memory>

namespace nearme {
namespace qt {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(AppConfig config, QWidget *parent = nullptr);
    ~MainWindow() override;

private slots:
    void onRefreshLocationClicked();
    void onReregisterClicked();
    void onOpenSettingsClicked();
    void onMoveClicked();
    void onDriveClicked();
    void onPumpTick();
    void onDriveTick();

private:
    void setupUI();
    void refreshView();
    void appendEventLog(const QString& message);
    void loadConfiguration();
    void saveConfiguration();

    // Status card
    QLabel* m_statusLabel;
    QLabel* m_permissionLabel;
    QLabel* m_accuracyWarning;
    QLabel* m_settingsWarning;
    QLabel* m_geofenceLabel;
    QLabel* m_lastEventLabel;
    QLabel* m_positionLabel;
    QPushButton* m_refreshButton;
    QPushButton* m_reregisterButton;
    QPushButton* m_settingsButton;

    // Saved locations
    QListWidget* m_targetList;

    // Simulated device
    QDoubleSpinBox* m_latSpin;
    QDoubleSpinBox* m_lonSpin;
    QPushButton* m_moveButton;
    QPushButton* m_driveButton;

    QTextEdit* m_eventLog;
    QSystemTrayIcon* m_trayIcon;

    std::unique_ptr<DesktopRuntime> m_runtime;

    QTimer* m_pumpTimer;
    QTimer* m_driveTimer;
    int m_driveStep = 0;
};

} // namespace qt
} // namespace nearme
