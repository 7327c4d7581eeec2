#pragma once

#include "../Geo.hpp"
#include <functional>
#include <string>

namespace nearme::ports {

enum class LocationAccuracyStatus {
    Precise,
    Reduced
};

struct PositionStreamSettings {
    bool highAccuracy = true;
    double distanceFilterMeters = 10.0;
};

class ILocationProvider {
public:
    virtual ~ILocationProvider() = default;

    using PositionCallback = std::function<void(const Location&)>;
    using ErrorCallback = std::function<void(const std::string& error)>;

    virtual bool isLocationServiceEnabled() const = 0;

    /// False on platforms without a precise/reduced distinction
    virtual bool supportsAccuracyStatus() const = 0;
    virtual LocationAccuracyStatus accuracyStatus() const = 0;

    /// Throws std::runtime_error when no fix is available
    virtual Location currentPosition() = 0;

    /// Replaces any running stream. Callbacks fire from processEvents().
    virtual void startPositionStream(const PositionStreamSettings& settings,
                                     PositionCallback onPosition,
                                     ErrorCallback onError) = 0;
    virtual void stopPositionStream() = 0;

    virtual void processEvents() = 0;
};

} // namespace nearme::ports
