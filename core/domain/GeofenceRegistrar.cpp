#include "GeofenceRegistrar.hpp"
#include <iostream>

namespace nearme::domain {

namespace {

class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

std::string preconditionToString(Precondition precondition) {
    switch (precondition) {
        case Precondition::LocationPermission: return "location permission";
        case Precondition::AlwaysPermission: return "background (always) location permission";
        case Precondition::PreciseLocation: return "precise location";
    }
    return "unknown";
}

GeofenceRegistrar::GeofenceRegistrar(std::shared_ptr<ports::IGeofenceService> service,
                                     ports::GeofenceCallback callback,
                                     ports::PlatformHints hints)
    : service_(service), callback_(std::move(callback)), hints_(std::move(hints)) {
}

RegistrationResult GeofenceRegistrar::synchronize(const std::vector<Target>& targets,
                                                  const PermissionSnapshot& snapshot) {
    RegistrationResult result;

    if (auto failed = checkPreconditions(snapshot)) {
        result.status = RegistrationStatus::PreconditionFailed;
        result.failedPrecondition = failed;
        result.errorMessage = "missing " + preconditionToString(*failed);
        std::cerr << "[Registrar] Not registering: " << result.errorMessage << std::endl;
        return result;
    }

    if (targets.empty()) {
        result.noTargets = true;
        return result;
    }

    if (inFlight_.exchange(true)) {
        result.status = RegistrationStatus::AlreadyInProgress;
        result.errorMessage = "synchronization already in progress";
        return result;
    }
    InFlightGuard guard(inFlight_);

    return runSynchronize(targets);
}

RegistrationResult GeofenceRegistrar::runSynchronize(const std::vector<Target>& targets) {
    RegistrationResult result;

    try {
        service_->clearAll();
    } catch (const ports::GeofenceServiceException& e) {
        result.status = RegistrationStatus::ServiceError;
        result.serviceErrorCode = e.code();
        result.errorMessage = e.what();
        std::cerr << "[Registrar] clearAll failed: " << e.what() << std::endl;
        return result;
    }

    for (const auto& target : targets) {
        auto descriptor = buildDescriptor(target);
        try {
            service_->registerGeofence(descriptor, callback_);
            result.submittedCount++;
        } catch (const ports::GeofenceServiceException& e) {
            std::cerr << "[Registrar] Rejected " << descriptor.key << " ("
                      << ports::geofenceErrorCodeToString(e.code()) << "): " << e.what() << std::endl;
            result.failures.push_back({descriptor.key, e.code(), e.what()});
        }
    }

    try {
        result.activeCount = static_cast<int>(service_->listActive().size());
    } catch (const ports::GeofenceServiceException& e) {
        result.status = RegistrationStatus::ServiceError;
        result.serviceErrorCode = e.code();
        result.errorMessage = e.what();
        std::cerr << "[Registrar] listActive failed: " << e.what() << std::endl;
        return result;
    }

    std::cout << "[Registrar] Submitted " << result.submittedCount << "/" << targets.size()
              << ", service reports " << result.activeCount << " active" << std::endl;
    return result;
}

ports::GeofenceDescriptor GeofenceRegistrar::buildDescriptor(const Target& target) const {
    ports::GeofenceDescriptor descriptor;
    descriptor.key = target.geofenceKey();
    descriptor.latitude = target.latitude;
    descriptor.longitude = target.longitude;
    descriptor.radiusMeters = target.effectiveRadius();
    descriptor.triggers = {TransitionKind::Enter, TransitionKind::Exit};
    descriptor.hints = hints_;
    return descriptor;
}

std::string GeofenceRegistrar::describe(const RegistrationResult& result) {
    switch (result.status) {
        case RegistrationStatus::Success: {
            if (result.noTargets) {
                return "No saved locations to monitor.";
            }
            std::string text = "Registered " + std::to_string(result.activeCount) + " geofences.";
            if (!result.failures.empty()) {
                text += " " + std::to_string(result.failures.size()) + " rejected.";
            }
            return text;
        }
        case RegistrationStatus::PreconditionFailed:
            switch (result.failedPrecondition.value_or(Precondition::LocationPermission)) {
                case Precondition::AlwaysPermission:
                    return "Background geofences need \"Allow all the time\" location permission.";
                case Precondition::PreciseLocation:
                    return "Enable precise location to register geofences.";
                default:
                    return "Location permissions are required before registering geofences.";
            }
        case RegistrationStatus::AlreadyInProgress:
            return "Geofence registration already in progress.";
        case RegistrationStatus::ServiceError:
            return "Geofence error: " + ports::geofenceErrorCodeToString(
                result.serviceErrorCode.value_or(ports::GeofenceErrorCode::Unknown));
    }
    return "Geofence error: unknown";
}

std::optional<Precondition> GeofenceRegistrar::checkPreconditions(const PermissionSnapshot& snapshot) {
    if (!snapshot.locationGranted) {
        return Precondition::LocationPermission;
    }
    if (!snapshot.alwaysGranted) {
        return Precondition::AlwaysPermission;
    }
    if (!snapshot.preciseLocation) {
        return Precondition::PreciseLocation;
    }
    return std::nullopt;
}

} // namespace nearme::domain
