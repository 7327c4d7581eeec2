#pragma once

#include "../Target.hpp"
#include "../ports/IGeofenceService.hpp"
#include "PermissionEvaluator.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nearme::domain {

enum class RegistrationStatus {
    Success,
    PreconditionFailed,  ///< No external call was made
    AlreadyInProgress,   ///< Another synchronize() is running; no external call was made
    ServiceError         ///< clearAll() or listActive() failed
};

enum class Precondition {
    LocationPermission,
    AlwaysPermission,
    PreciseLocation
};

/// One rejected descriptor. The batch continues past it.
struct RegistrationError {
    std::string geofenceKey;
    ports::GeofenceErrorCode code = ports::GeofenceErrorCode::Unknown;
    std::string message;
};

struct RegistrationResult {
    RegistrationStatus status = RegistrationStatus::Success;
    int activeCount = 0;            ///< As reported by the service after submission
    int submittedCount = 0;
    bool noTargets = false;
    std::optional<Precondition> failedPrecondition;
    std::optional<ports::GeofenceErrorCode> serviceErrorCode;
    std::string errorMessage;
    std::vector<RegistrationError> failures;

    bool ok() const { return status == RegistrationStatus::Success; }
};

std::string preconditionToString(Precondition precondition);

/**
 * @brief Makes the service's registration table equal to the target set
 *
 * Every call is a full replace: clear, submit every target, then read back
 * the active count. Calls are single-flight; an overlapping call returns
 * AlreadyInProgress instead of racing a second clear-and-register pass.
 */
class GeofenceRegistrar {
public:
    GeofenceRegistrar(std::shared_ptr<ports::IGeofenceService> service,
                      ports::GeofenceCallback callback,
                      ports::PlatformHints hints = {});

    RegistrationResult synchronize(const std::vector<Target>& targets,
                                   const PermissionSnapshot& snapshot);

    bool isSynchronizing() const { return inFlight_.load(); }

    ports::GeofenceDescriptor buildDescriptor(const Target& target) const;

    static std::string describe(const RegistrationResult& result);

private:
    RegistrationResult runSynchronize(const std::vector<Target>& targets);
    static std::optional<Precondition> checkPreconditions(const PermissionSnapshot& snapshot);

    std::shared_ptr<ports::IGeofenceService> service_;
    ports::GeofenceCallback callback_;
    ports::PlatformHints hints_;
    std::atomic<bool> inFlight_{false};
};

} // namespace nearme::domain
