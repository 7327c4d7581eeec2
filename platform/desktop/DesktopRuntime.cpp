#include "DesktopRuntime.hpp"
#include "../../core/adapters/MqttRelayPort.hpp"
#include "../../net/mqtt/PahoMqttClient.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace nearme {

namespace {

// Roughly 1.1 km of latitude
constexpr double kRouteApproachDegrees = 0.01;

} // namespace

DesktopRuntime::DesktopRuntime(AppConfig config, NotificationFactory notificationFactory)
    : config_(std::move(config)),
      notificationFactory_(std::move(notificationFactory)),
      geofences_(std::make_shared<sim::SimulatedGeofenceService>(config_.capacity)),
      location_(std::make_shared<sim::SimulatedLocationProvider>()),
      permissions_(std::make_shared<sim::ScriptedPermissionSubsystem>()),
      foregroundRegistry_(std::make_shared<domain::PortRegistry>()) {

    permissions_->setStatus(ports::Permission::Location, config_.location);
    permissions_->setStatus(ports::Permission::LocationAlways, config_.locationAlways);
    permissions_->setStatus(ports::Permission::Notification, config_.notification);

    location_->setServiceEnabled(config_.locationServiceEnabled);
    location_->setSupportsAccuracyStatus(config_.supportsAccuracyStatus);
    location_->setAccuracyStatus(config_.accuracy);
    if (config_.startPosition) {
        location_->setPosition(*config_.startPosition);
        geofences_->updatePosition(*config_.startPosition);
    }

    if (config_.useMqttRelay()) {
        publisher_ = std::make_shared<PahoMqttClient>();
        subscriber_ = std::make_shared<PahoMqttClient>();
        backgroundRegistry_ = std::make_shared<domain::PortRegistry>();
        backgroundRegistry_->registerPortWithName(
            std::make_shared<adapters::MqttRelayPort>(publisher_, config_.relayPortName),
            config_.relayPortName);
        bridge_ = std::make_unique<adapters::MqttRelayBridge>(subscriber_, foregroundRegistry_,
                                                              config_.relayPortName);
    } else {
        backgroundRegistry_ = foregroundRegistry_;
    }

    auto monitoring = monitoringConfig(config_);

    domain::BackgroundBootstrap bootstrap;
    bootstrap.notificationFactory = notificationFactory_;
    bootstrap.registry = backgroundRegistry_;
    bootstrap.clock = std::make_shared<SystemClock>();
    bootstrap.channelSettings = monitoring.channelSettings;
    bootstrap.relayPortName = config_.relayPortName;

    domain::MonitoringServices services;
    services.geofences = geofences_;
    services.notifications = notificationFactory_();
    services.permissions = permissions_;
    services.location = location_;
    services.registry = foregroundRegistry_;

    controller_ = std::make_unique<domain::MonitoringController>(
        services, domain::makeBackgroundEntryPoint(bootstrap), monitoring);
}

DesktopRuntime::~DesktopRuntime() {
    stop();
}

void DesktopRuntime::start() {
    if (config_.useMqttRelay()) {
        bridge_->start();
        if (!connectRelayClient(*subscriber_, config_, "-fg") ||
            !connectRelayClient(*publisher_, config_, "-bg")) {
            std::cerr << "[Relay] MQTT relay unavailable; transitions will be dropped" << std::endl;
        }
    }
    controller_->start();
}

void DesktopRuntime::stop() {
    controller_->stop();
    if (bridge_) {
        bridge_->stop();
    }
    if (publisher_) {
        publisher_->disconnect();
    }
    if (subscriber_) {
        subscriber_->disconnect();
    }
}

void DesktopRuntime::moveTo(const Location& position) {
    location_->pushPosition(position);
    geofences_->updatePosition(position);
}

std::vector<RoutePoint> DesktopRuntime::route() const {
    if (!config_.route.empty()) {
        return config_.route;
    }

    const auto& targets = controller_->targets();
    if (targets.empty()) {
        return {};
    }

    std::vector<RoutePoint> route;
    route.push_back({targets.front().latitude - kRouteApproachDegrees, targets.front().longitude});
    for (const auto& target : targets) {
        route.push_back({target.latitude, target.longitude});
    }
    route.push_back({targets.back().latitude + kRouteApproachDegrees, targets.back().longitude});
    return route;
}

std::string DesktopRuntime::describeRow(const domain::TargetRow& row) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(0);
    out << (row.inside ? "  * " : "    ") << row.target.name << " (radius " << row.radiusMeters << " m";
    if (row.distanceMeters) {
        out << ", " << *row.distanceMeters << " m away";
    }
    out << ")";
    return out.str();
}

domain::MonitoringConfig DesktopRuntime::monitoringConfig(const AppConfig& config) {
    domain::MonitoringConfig monitoring;
    monitoring.targetsPath = config.targetsFile;
    monitoring.streamSettings.highAccuracy = config.highAccuracy;
    monitoring.streamSettings.distanceFilterMeters = config.distanceFilterMeters;
    monitoring.hints.notificationResponsiveness = std::chrono::seconds(config.responsivenessSeconds);
    monitoring.hints.initialTriggerOnRegister = config.initialTrigger;
    monitoring.relayPortName = config.relayPortName;
    return monitoring;
}

bool DesktopRuntime::connectRelayClient(IMqttClient& client, const AppConfig& config,
                                        const std::string& clientIdSuffix,
                                        std::chrono::milliseconds timeout) {
    const std::string clientId = config.mqttClientId + clientIdSuffix;

    bool started = false;
    if (config.mqttTls) {
        TlsConfig tls;
        tls.caPath = config.mqttCaPath;
        started = client.connectWithTls(config.mqttHost, config.mqttPort, clientId, config.mqttUsername, tls);
    } else {
        started = client.connect(config.mqttHost, config.mqttPort, clientId,
                                 config.mqttUsername, config.mqttPassword);
    }
    if (!started) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!client.isConnected() && std::chrono::steady_clock::now() < deadline) {
        client.processEvents();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return client.isConnected();
}

} // namespace nearme
