#include "MonitoringController.hpp"
#include <iostream>

namespace nearme::domain {

MonitoringController::MonitoringController(MonitoringServices services,
                                           ports::GeofenceCallback backgroundEntryPoint,
                                           MonitoringConfig config)
    : services_(std::move(services)),
      config_(std::move(config)),
      evaluator_(services_.permissions, services_.location),
      registrar_(services_.geofences, std::move(backgroundEntryPoint), config_.hints),
      relayPort_(std::make_shared<RelayReceivePort>()) {
    if (!services_.registry) {
        services_.registry = std::make_shared<PortRegistry>();
    }
}

MonitoringController::~MonitoringController() {
    stop();
}

void MonitoringController::start() {
    if (running_) {
        return;
    }
    running_ = true;

    attachRelayPort();
    initNotifications();
    loadTargets();

    if (!initGeofenceService()) {
        notifyChanged();
        return;
    }

    auto snapshot = evaluatePermissions();
    if (!snapshot.locationGranted) {
        notifyChanged();
        return;
    }

    if (snapshot.alwaysGranted && snapshot.preciseLocation) {
        registerGeofences(snapshot);
    } else {
        geofencesRegistered_ = false;
        if (!snapshot.alwaysGranted) {
            setStatus("Background geofences need \"Allow all the time\" location permission.");
        } else {
            setStatus("Precise location is required for geofences.");
        }
    }

    startLocationStream();
    notifyChanged();
}

void MonitoringController::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    try {
        services_.location->stopPositionStream();
    } catch (const std::exception& e) {
        std::cerr << "[Monitor] Stopping position stream failed: " << e.what() << std::endl;
    }

    relayPort_->close();
    // A newer foreground instance may own the name by now
    if (services_.registry->lookupPortByName(config_.relayPortName) == relayPort_) {
        services_.registry->removePortNameMapping(config_.relayPortName);
    }
}

void MonitoringController::reregister() {
    auto snapshot = evaluatePermissions();
    registerGeofences(snapshot);
    notifyChanged();
}

void MonitoringController::refreshLocation() {
    try {
        position_ = services_.location->currentPosition();
    } catch (const std::exception& e) {
        setStatus(std::string("Unable to get current position: ") + e.what());
    }
    notifyChanged();
}

bool MonitoringController::openSettings() {
    return evaluator_.openSettings();
}

size_t MonitoringController::processEvents() {
    try {
        services_.location->processEvents();
    } catch (const std::exception& e) {
        setStatus(std::string("Location error: ") + e.what());
        notifyChanged();
    }
    return relayPort_->processEvents();
}

std::vector<TargetRow> MonitoringController::rows() const {
    std::vector<TargetRow> rows;
    rows.reserve(targets_.size());

    for (const auto& target : targets_) {
        TargetRow row;
        row.target = target;
        row.radiusMeters = target.effectiveRadius();
        if (position_) {
            row.distanceMeters = ReconciliationState::distanceTo(target, *position_);
        }
        row.inside = reconciliation_.isInside(target.geofenceKey());
        rows.push_back(row);
    }
    return rows;
}

void MonitoringController::attachRelayPort() {
    if (relayPort_->isClosed()) {
        relayPort_ = std::make_shared<RelayReceivePort>();
    }
    services_.registry->removePortNameMapping(config_.relayPortName);
    services_.registry->registerPortWithName(relayPort_, config_.relayPortName);
    relayPort_->listen([this](const TransitionEvent& event) { onRelayedTransition(event); });
}

void MonitoringController::initNotifications() {
    try {
        if (!services_.notifications->initialize(config_.channelSettings)) {
            std::cerr << "[Monitor] Notification channel " << config_.channelSettings.channelId
                      << " not available" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Monitor] Notification setup failed: " << e.what() << std::endl;
    }
}

void MonitoringController::loadTargets() {
    TargetStore store(config_.targetsPath);
    try {
        targets_ = store.load();
        setStatus("Loaded " + std::to_string(targets_.size()) + " saved locations.");
    } catch (const LoadError& e) {
        targets_.clear();
        setStatus(std::string("Failed to load saved locations: ") + e.what());
    }
}

bool MonitoringController::initGeofenceService() {
    try {
        services_.geofences->initialize();
        return true;
    } catch (const ports::GeofenceServiceException& e) {
        geofencesRegistered_ = false;
        setStatus("Geofence error: " + ports::geofenceErrorCodeToString(e.code()));
    } catch (const std::exception& e) {
        geofencesRegistered_ = false;
        setStatus(std::string("Geofence error: ") + e.what());
    }
    return false;
}

PermissionSnapshot MonitoringController::evaluatePermissions() {
    auto snapshot = evaluator_.evaluate();

    permissions_ = snapshot;
    permissionStatus_ = PermissionEvaluator::describe(snapshot);
    needsSettings_ = snapshot.needsManualSettings;
    accuracyStatus_ = snapshot.accuracyStatus;

    if (!snapshot.locationServiceEnabled) {
        setStatus("Location services are disabled.");
    }
    return snapshot;
}

void MonitoringController::registerGeofences(const PermissionSnapshot& snapshot) {
    RegistrationResult result;
    try {
        result = registrar_.synchronize(targets_, snapshot);
    } catch (const std::exception& e) {
        geofencesRegistered_ = false;
        setStatus(std::string("Geofence error: ") + e.what());
        return;
    }

    switch (result.status) {
        case RegistrationStatus::Success:
            if (!result.noTargets) {
                geofencesRegistered_ = true;
            }
            break;
        case RegistrationStatus::PreconditionFailed:
        case RegistrationStatus::ServiceError:
            geofencesRegistered_ = false;
            break;
        case RegistrationStatus::AlreadyInProgress:
            break;
    }

    setStatus(GeofenceRegistrar::describe(result));
    lastRegistration_ = std::move(result);
}

void MonitoringController::startLocationStream() {
    try {
        services_.location->stopPositionStream();
        services_.location->startPositionStream(
            config_.streamSettings,
            [this](const Location& location) {
                position_ = location;
                notifyChanged();
            },
            [this](const std::string& error) {
                setStatus("Location error: " + error);
                notifyChanged();
            });
    } catch (const std::exception& e) {
        setStatus(std::string("Location error: ") + e.what());
    }

    refreshLocation();
}

void MonitoringController::onRelayedTransition(const TransitionEvent& event) {
    reconciliation_.applyTransition(event);
    std::cout << "[Monitor] " << reconciliation_.lastEventSummary() << std::endl;
    notifyChanged();
}

void MonitoringController::setStatus(const std::string& status) {
    status_ = status;
    std::cout << "[Monitor] " << status << std::endl;
}

void MonitoringController::notifyChanged() {
    if (changeListener_) {
        changeListener_();
    }
}

} // namespace nearme::domain
