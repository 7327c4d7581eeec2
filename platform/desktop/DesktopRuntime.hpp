#pragma once

#include "TomlConfig.hpp"
#include "../../core/IMqttClient.hpp"
#include "../../core/adapters/MqttRelayBridge.hpp"
#include "../../core/domain/BackgroundEventHandler.hpp"
#include "../../core/domain/MonitoringController.hpp"
#include "../../core/sim/ScriptedPermissionSubsystem.hpp"
#include "../../core/sim/SimulatedGeofenceService.hpp"
#include "../../core/sim/SimulatedLocationProvider.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nearme {

using NotificationFactory = std::function<std::shared_ptr<ports::INotificationChannel>()>;

/**
 * @brief Wires the monitoring core to simulated desktop services
 *
 * Shared by the CLI and the Qt front-end. In "local" relay mode the
 * background entry point and the foreground share one port registry. In
 * "mqtt" mode the background side only sees a registry holding an
 * MqttRelayPort and the foreground receives through an MqttRelayBridge,
 * exactly as two separate processes would.
 */
class DesktopRuntime {
public:
    DesktopRuntime(AppConfig config, NotificationFactory notificationFactory);
    ~DesktopRuntime();

    DesktopRuntime(const DesktopRuntime&) = delete;
    DesktopRuntime& operator=(const DesktopRuntime&) = delete;

    /// Connects the relay (mqtt mode) and starts the controller
    void start();
    void stop();

    domain::MonitoringController& controller() { return *controller_; }
    sim::SimulatedGeofenceService& geofences() { return *geofences_; }
    sim::SimulatedLocationProvider& location() { return *location_; }
    sim::ScriptedPermissionSubsystem& permissions() { return *permissions_; }
    const AppConfig& config() const { return config_; }

    /// Moves the simulated device; geofence callbacks fire synchronously
    void moveTo(const Location& position);

    /// Configured route, or one through every loaded target when none is configured
    std::vector<RoutePoint> route() const;

    static domain::MonitoringConfig monitoringConfig(const AppConfig& config);

    /// Saved-location line for the console, distances rounded to whole meters
    static std::string describeRow(const domain::TargetRow& row);

    /// Starts a connection for the relay and waits for it
    static bool connectRelayClient(IMqttClient& client, const AppConfig& config,
                                   const std::string& clientIdSuffix,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(5));

private:
    AppConfig config_;
    NotificationFactory notificationFactory_;

    std::shared_ptr<sim::SimulatedGeofenceService> geofences_;
    std::shared_ptr<sim::SimulatedLocationProvider> location_;
    std::shared_ptr<sim::ScriptedPermissionSubsystem> permissions_;

    std::shared_ptr<domain::PortRegistry> foregroundRegistry_;
    std::shared_ptr<domain::PortRegistry> backgroundRegistry_;
    std::shared_ptr<IMqttClient> publisher_;
    std::shared_ptr<IMqttClient> subscriber_;
    std::unique_ptr<adapters::MqttRelayBridge> bridge_;

    std::unique_ptr<domain::MonitoringController> controller_;
};

} // namespace nearme
