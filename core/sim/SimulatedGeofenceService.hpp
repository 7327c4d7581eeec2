#pragma once

#include "../Geo.hpp"
#include "../ports/IGeofenceService.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nearme::sim {

/**
 * @brief In-process stand-in for the OS geofence monitor
 *
 * Keeps a registration table, dispatches enter/exit callbacks as the
 * simulated position moves, and records every external call so tests can
 * assert on call counts. Failures are injected per operation or per key.
 */
class SimulatedGeofenceService : public ports::IGeofenceService {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit SimulatedGeofenceService(std::size_t capacity = kDefaultCapacity);
    ~SimulatedGeofenceService() override = default;

    // IGeofenceService interface
    void initialize() override;
    void clearAll() override;
    void registerGeofence(const ports::GeofenceDescriptor& descriptor,
                          ports::GeofenceCallback callback) override;
    std::vector<std::string> listActive() const override;

    // Position-driven dispatch
    void updatePosition(const Location& position);
    void fire(const std::vector<std::string>& keys, GeofenceEvent event);
    /// Delivers the most recent callback again (at-least-once delivery)
    bool redeliver();

    // Failure injection
    void rejectKey(const std::string& key, ports::GeofenceErrorCode code);
    void dropKey(const std::string& key);  ///< Accepted but never becomes active
    void setFailClear(std::optional<ports::GeofenceErrorCode> code) { failClear_ = code; }
    void setFailList(std::optional<ports::GeofenceErrorCode> code) { failList_ = code; }
    void setUnavailable(bool unavailable) { unavailable_ = unavailable; }
    void setCapacity(std::size_t capacity) { capacity_ = capacity; }

    // Inspection
    std::optional<ports::GeofenceDescriptor> descriptor(const std::string& key) const;
    std::size_t capacity() const { return capacity_; }
    bool isInitialized() const { return initialized_; }

    const std::vector<std::string>& callLog() const { return callLog_; }
    std::size_t externalCalls() const { return callLog_.size(); }
    int initializeCount() const { return initializeCount_; }
    int clearCount() const { return clearCount_; }
    int registerCount() const { return registerCount_; }
    int listCount() const { return listCount_; }
    int deliveries() const { return deliveries_; }
    void resetCallLog();

private:
    struct Registration {
        ports::GeofenceDescriptor descriptor;
        ports::GeofenceCallback callback;
        std::optional<bool> inside;
    };

    void checkAvailable() const;
    bool contains(const Registration& registration, const Location& position) const;
    void deliver(ports::GeofenceCallback callback, ports::GeofenceCallbackParams params);

    std::size_t capacity_;
    std::map<std::string, Registration> registrations_;
    std::set<std::string> dropped_;
    std::map<std::string, ports::GeofenceErrorCode> rejected_;
    std::optional<Location> position_;

    std::optional<ports::GeofenceErrorCode> failClear_;
    std::optional<ports::GeofenceErrorCode> failList_;
    bool unavailable_ = false;
    bool initialized_ = false;

    ports::GeofenceCallback lastCallback_;
    ports::GeofenceCallbackParams lastParams_;

    mutable std::vector<std::string> callLog_;
    int initializeCount_ = 0;
    int clearCount_ = 0;
    int registerCount_ = 0;
    mutable int listCount_ = 0;
    int deliveries_ = 0;
};

} // namespace nearme::sim
