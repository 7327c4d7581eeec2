#include "MainWindow.hpp"
#include "TrayNotificationChannel.hpp"
#include "../../core/Geo.hpp"

#include <QApplication>
#include <QStatusBar>
#include <QSettings>
#include <QDateTime>
#include <QStyle>
#include <QColor>
#include <algorithm>

namespace nearme {
namespace qt {

MainWindow::MainWindow(AppConfig config, QWidget *parent)
    : QMainWindow(parent)
    , m_trayIcon(new QSystemTrayIcon(this))
    , m_pumpTimer(new QTimer(this))
    , m_driveTimer(new QTimer(this))
{
    m_trayIcon->setIcon(style()->standardIcon(QStyle::SP_MessageBoxInformation));
    m_trayIcon->setToolTip("Near Me Alerts");
    m_trayIcon->show();

    setupUI();
    loadConfiguration();

    auto onShown = [this](int id, const QString& title, const QString& body) {
        appendEventLog(QString("Notification #%1: %2 (%3)").arg(id).arg(title, body));
    };
    QSystemTrayIcon* tray = m_trayIcon;
    m_runtime = std::make_unique<DesktopRuntime>(std::move(config), [tray, onShown]() {
        return std::make_shared<TrayNotificationChannel>(tray, onShown);
    });

    m_runtime->controller().setChangeListener([this]() { refreshView(); });

    connect(m_pumpTimer, &QTimer::timeout, this, &MainWindow::onPumpTick);
    m_pumpTimer->setInterval(250);

    connect(m_driveTimer, &QTimer::timeout, this, &MainWindow::onDriveTick);
    m_driveTimer->setInterval(m_runtime->config().stepMilliseconds);

    m_runtime->start();
    m_pumpTimer->start();
    refreshView();
}

MainWindow::~MainWindow() {
    m_pumpTimer->stop();
    m_driveTimer->stop();
    m_runtime->controller().setChangeListener(nullptr);
    m_runtime->stop();
    saveConfiguration();
}

void MainWindow::setupUI() {
    setWindowTitle("Near Me Alerts");
    setMinimumSize(640, 600);

    auto* central = new QWidget;
    setCentralWidget(central);
    auto* mainLayout = new QVBoxLayout(central);

    // Status card
    auto* statusGroup = new QGroupBox("Status");
    auto* statusLayout = new QVBoxLayout(statusGroup);

    m_statusLabel = new QLabel("Initializing...");
    m_statusLabel->setWordWrap(true);
    statusLayout->addWidget(m_statusLabel);

    m_permissionLabel = new QLabel("Permissions: Unknown");
    statusLayout->addWidget(m_permissionLabel);

    m_accuracyWarning = new QLabel("Precise location is off. Enable it for geofences.");
    m_accuracyWarning->setStyleSheet("color: orange;");
    m_accuracyWarning->setVisible(false);
    statusLayout->addWidget(m_accuracyWarning);

    m_settingsWarning = new QLabel("Some permissions are blocked. Open settings to enable them.");
    m_settingsWarning->setStyleSheet("color: red;");
    m_settingsWarning->setVisible(false);
    statusLayout->addWidget(m_settingsWarning);

    m_geofenceLabel = new QLabel("Geofences: Inactive");
    statusLayout->addWidget(m_geofenceLabel);

    m_lastEventLabel = new QLabel("Last event: None");
    statusLayout->addWidget(m_lastEventLabel);

    m_positionLabel = new QLabel("Current position: Unknown");
    statusLayout->addWidget(m_positionLabel);

    auto* buttonLayout = new QHBoxLayout;
    m_refreshButton = new QPushButton("Refresh Location");
    m_reregisterButton = new QPushButton("Re-register Geofences");
    m_settingsButton = new QPushButton("Open Settings");
    m_settingsButton->setVisible(false);

    buttonLayout->addWidget(m_refreshButton);
    buttonLayout->addWidget(m_reregisterButton);
    buttonLayout->addWidget(m_settingsButton);
    buttonLayout->addStretch();
    statusLayout->addLayout(buttonLayout);

    mainLayout->addWidget(statusGroup);

    connect(m_refreshButton, &QPushButton::clicked, this, &MainWindow::onRefreshLocationClicked);
    connect(m_reregisterButton, &QPushButton::clicked, this, &MainWindow::onReregisterClicked);
    connect(m_settingsButton, &QPushButton::clicked, this, &MainWindow::onOpenSettingsClicked);

    // Saved locations
    auto* targetsGroup = new QGroupBox("Saved locations");
    auto* targetsLayout = new QVBoxLayout(targetsGroup);
    m_targetList = new QListWidget;
    targetsLayout->addWidget(m_targetList);
    mainLayout->addWidget(targetsGroup);

    // Simulated device
    auto* deviceGroup = new QGroupBox("Simulated device");
    auto* deviceLayout = new QFormLayout(deviceGroup);

    m_latSpin = new QDoubleSpinBox;
    m_latSpin->setRange(-90.0, 90.0);
    m_latSpin->setDecimals(6);
    m_latSpin->setSingleStep(0.001);
    deviceLayout->addRow("Latitude:", m_latSpin);

    m_lonSpin = new QDoubleSpinBox;
    m_lonSpin->setRange(-180.0, 180.0);
    m_lonSpin->setDecimals(6);
    m_lonSpin->setSingleStep(0.001);
    deviceLayout->addRow("Longitude:", m_lonSpin);

    auto* deviceButtons = new QHBoxLayout;
    m_moveButton = new QPushButton("Move Here");
    m_driveButton = new QPushButton("Drive Route");
    deviceButtons->addWidget(m_moveButton);
    deviceButtons->addWidget(m_driveButton);
    deviceButtons->addStretch();
    deviceLayout->addRow(deviceButtons);

    mainLayout->addWidget(deviceGroup);

    connect(m_moveButton, &QPushButton::clicked, this, &MainWindow::onMoveClicked);
    connect(m_driveButton, &QPushButton::clicked, this, &MainWindow::onDriveClicked);

    m_eventLog = new QTextEdit;
    m_eventLog->setReadOnly(true);
    m_eventLog->document()->setMaximumBlockCount(1000);
    mainLayout->addWidget(m_eventLog);

    statusBar()->showMessage("Ready");
}

void MainWindow::onRefreshLocationClicked() {
    m_runtime->controller().refreshLocation();
}

void MainWindow::onReregisterClicked() {
    m_runtime->controller().reregister();
    appendEventLog(QString::fromStdString(m_runtime->controller().status()));
}

void MainWindow::onOpenSettingsClicked() {
    if (m_runtime->controller().openSettings()) {
        appendEventLog("Opened app settings");
    }
}

void MainWindow::onMoveClicked() {
    m_runtime->moveTo({m_latSpin->value(), m_lonSpin->value(), 5.0});
}

void MainWindow::onDriveClicked() {
    if (m_driveTimer->isActive()) {
        m_driveTimer->stop();
        m_driveButton->setText("Drive Route");
        return;
    }
    if (m_runtime->route().empty()) {
        appendEventLog("Nothing to drive past");
        return;
    }

    m_driveStep = 0;
    m_driveButton->setText("Stop Driving");
    m_driveTimer->start();
}

void MainWindow::onPumpTick() {
    m_runtime->controller().processEvents();
}

void MainWindow::onDriveTick() {
    const int steps = std::max(1, m_runtime->config().routeSteps);
    if (m_driveStep > steps) {
        m_driveTimer->stop();
        m_driveButton->setText("Drive Route");
        return;
    }

    auto position = Geo::interpolateRoute(m_runtime->route(), static_cast<double>(m_driveStep) / steps);
    position.accuracy = 5.0;
    m_latSpin->setValue(position.lat);
    m_lonSpin->setValue(position.lon);
    m_runtime->moveTo(position);
    m_driveStep++;
}

void MainWindow::refreshView() {
    if (!m_runtime) {
        return;
    }
    const auto& controller = m_runtime->controller();

    m_statusLabel->setText(QString::fromStdString(controller.status()));
    m_permissionLabel->setText("Permissions: " + QString::fromStdString(controller.permissionStatus()));
    m_accuracyWarning->setVisible(controller.accuracyStatus() == ports::LocationAccuracyStatus::Reduced);
    m_settingsWarning->setVisible(controller.needsSettings());
    m_settingsButton->setVisible(controller.needsSettings());
    m_geofenceLabel->setText(controller.geofencesRegistered() ? "Geofences: Active" : "Geofences: Inactive");
    m_lastEventLabel->setText("Last event: " + QString::fromStdString(controller.lastEvent()));

    if (const auto& position = controller.currentPosition()) {
        m_positionLabel->setText(QString("Current position: %1, %2")
                                     .arg(position->lat, 0, 'f', 5)
                                     .arg(position->lon, 0, 'f', 5));
    } else {
        m_positionLabel->setText("Current position: Unknown");
    }

    m_targetList->clear();
    for (const auto& row : controller.rows()) {
        QString text = QString("%1\nRadius: %2 m")
                           .arg(QString::fromStdString(row.target.name))
                           .arg(row.radiusMeters, 0, 'f', 0);
        if (row.distanceMeters) {
            text += QString(" • Distance: %1 m").arg(*row.distanceMeters, 0, 'f', 0);
        }

        auto* item = new QListWidgetItem(text, m_targetList);
        if (row.inside) {
            item->setBackground(QColor(200, 240, 200));
            item->setIcon(style()->standardIcon(QStyle::SP_DialogApplyButton));
        }
    }

    statusBar()->showMessage(controller.geofencesRegistered() ? "Monitoring" : "Not monitoring");
}

void MainWindow::appendEventLog(const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss");
    m_eventLog->append(QString("[%1] %2").arg(timestamp, message));
}

void MainWindow::loadConfiguration() {
    QSettings settings;

    m_latSpin->setValue(settings.value("device/lat", 0.0).toDouble());
    m_lonSpin->setValue(settings.value("device/lon", 0.0).toDouble());

    restoreGeometry(settings.value("window/geometry").toByteArray());
    restoreState(settings.value("window/state").toByteArray());
}

void MainWindow::saveConfiguration() {
    QSettings settings;

    settings.setValue("device/lat", m_latSpin->value());
    settings.setValue("device/lon", m_lonSpin->value());

    settings.setValue("window/geometry", saveGeometry());
    settings.setValue("window/state", saveState());
}

} // namespace qt
} // namespace nearme
