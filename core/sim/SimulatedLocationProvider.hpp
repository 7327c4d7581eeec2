#pragma once

#include "../ports/ILocationProvider.hpp"
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <variant>

namespace nearme::sim {

/**
 * Location provider fed by tests or a simulated route. Pushed positions and
 * errors are queued and reach the stream callbacks only from processEvents(),
 * which mirrors delivery on the foreground loop.
 */
class SimulatedLocationProvider : public ports::ILocationProvider {
public:
    SimulatedLocationProvider() = default;
    ~SimulatedLocationProvider() override = default;

    // ILocationProvider interface
    bool isLocationServiceEnabled() const override;
    bool supportsAccuracyStatus() const override;
    ports::LocationAccuracyStatus accuracyStatus() const override;
    Location currentPosition() override;
    void startPositionStream(const ports::PositionStreamSettings& settings,
                             PositionCallback onPosition,
                             ErrorCallback onError) override;
    void stopPositionStream() override;
    void processEvents() override;

    // Simulation controls
    void setServiceEnabled(bool enabled);
    void setSupportsAccuracyStatus(bool supported);
    void setAccuracyStatus(ports::LocationAccuracyStatus status);
    void setPosition(const Location& position);
    void clearPosition();
    /// currentPosition() throws with this message until cleared
    void setCurrentPositionError(std::optional<std::string> error);

    /// Updates the current fix and queues it for the stream
    void pushPosition(const Location& position);
    void pushError(const std::string& error);

    bool isStreaming() const;
    int streamStarts() const;
    std::optional<ports::PositionStreamSettings> streamSettings() const;
    size_t pending() const;

private:
    using StreamItem = std::variant<Location, std::string>;

    mutable std::mutex mutex_;
    bool serviceEnabled_ = true;
    bool supportsAccuracy_ = true;
    ports::LocationAccuracyStatus accuracy_ = ports::LocationAccuracyStatus::Precise;
    std::optional<Location> position_;
    std::optional<std::string> currentPositionError_;

    bool streaming_ = false;
    int streamStarts_ = 0;
    std::optional<ports::PositionStreamSettings> settings_;
    PositionCallback onPosition_;
    ErrorCallback onError_;
    std::queue<StreamItem> queue_;
};

} // namespace nearme::sim
