#pragma once

#include "../Geo.hpp"
#include "../Target.hpp"
#include "../ports/IGeofenceService.hpp"
#include "../ports/ILocationProvider.hpp"
#include "../ports/INotificationChannel.hpp"
#include "../ports/IPermissionSubsystem.hpp"
#include "GeofenceRegistrar.hpp"
#include "PermissionEvaluator.hpp"
#include "PortRegistry.hpp"
#include "ReconciliationState.hpp"
#include "RelayReceivePort.hpp"
#include "TargetStore.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nearme::domain {

struct MonitoringConfig {
    std::string targetsPath = "assets/coordinates.json";
    ports::PositionStreamSettings streamSettings;
    ports::NotificationChannelSettings channelSettings;
    ports::PlatformHints hints;
    std::string relayPortName = kGeofenceRelayPortName;
};

/// Platform collaborators of the foreground context
struct MonitoringServices {
    std::shared_ptr<ports::IGeofenceService> geofences;
    std::shared_ptr<ports::INotificationChannel> notifications;
    std::shared_ptr<ports::IPermissionSubsystem> permissions;
    std::shared_ptr<ports::ILocationProvider> location;
    std::shared_ptr<PortRegistry> registry;
};

/// One line of the saved-locations list
struct TargetRow {
    Target target;
    double radiusMeters = kDefaultRadiusMeters;
    std::optional<double> distanceMeters;  ///< Unset until a position is known
    bool inside = false;
};

/**
 * @brief Foreground orchestration behind the desktop front-ends
 *
 * Owns the reconciliation state and the relay receive port. Every public
 * operation converts failures into the status string; nothing throws out.
 * Not thread-safe: call everything from the foreground thread.
 */
class MonitoringController {
public:
    using ChangeListener = std::function<void()>;

    MonitoringController(MonitoringServices services,
                         ports::GeofenceCallback backgroundEntryPoint,
                         MonitoringConfig config = {});
    ~MonitoringController();

    MonitoringController(const MonitoringController&) = delete;
    MonitoringController& operator=(const MonitoringController&) = delete;

    void start();
    void stop();

    void reregister();
    void refreshLocation();
    bool openSettings();

    /// Pumps position updates and relayed transitions. Returns relayed count.
    size_t processEvents();

    void setChangeListener(ChangeListener listener) { changeListener_ = std::move(listener); }

    const std::string& status() const { return status_; }
    const std::string& permissionStatus() const { return permissionStatus_; }
    bool needsSettings() const { return needsSettings_; }
    bool geofencesRegistered() const { return geofencesRegistered_; }
    std::string lastEvent() const { return reconciliation_.lastEventSummary(); }
    const std::optional<Location>& currentPosition() const { return position_; }
    const std::optional<ports::LocationAccuracyStatus>& accuracyStatus() const { return accuracyStatus_; }
    const std::optional<PermissionSnapshot>& permissions() const { return permissions_; }
    const std::optional<RegistrationResult>& lastRegistration() const { return lastRegistration_; }
    const std::vector<Target>& targets() const { return targets_; }
    std::vector<TargetRow> rows() const;

    const ReconciliationState& reconciliation() const { return reconciliation_; }
    std::shared_ptr<RelayReceivePort> relayPort() const { return relayPort_; }
    bool isRunning() const { return running_; }

private:
    void attachRelayPort();
    void initNotifications();
    void loadTargets();
    bool initGeofenceService();
    PermissionSnapshot evaluatePermissions();
    void registerGeofences(const PermissionSnapshot& snapshot);
    void startLocationStream();
    void onRelayedTransition(const TransitionEvent& event);
    void setStatus(const std::string& status);
    void notifyChanged();

    MonitoringServices services_;
    MonitoringConfig config_;
    PermissionEvaluator evaluator_;
    GeofenceRegistrar registrar_;
    std::shared_ptr<RelayReceivePort> relayPort_;
    ReconciliationState reconciliation_;

    std::vector<Target> targets_;
    std::optional<Location> position_;
    std::optional<ports::LocationAccuracyStatus> accuracyStatus_;
    std::optional<PermissionSnapshot> permissions_;
    std::optional<RegistrationResult> lastRegistration_;

    std::string status_ = "Initializing...";
    std::string permissionStatus_ = "Unknown";
    bool needsSettings_ = false;
    bool geofencesRegistered_ = false;
    bool running_ = false;

    ChangeListener changeListener_;
};

} // namespace nearme::domain
