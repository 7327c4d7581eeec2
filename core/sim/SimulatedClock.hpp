#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <string>

namespace nearme::sim {

/// Wall clock under test control. Frozen clocks only move on advance().
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now(),
                            bool frozen = true);
    ~SimulatedClock() override = default;

    std::chrono::system_clock::time_point now() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);

    void freezeTime();
    void unfreezeTime();
    bool isFrozen() const { return frozen_; }

    /// Parses "YYYY-MM-DDTHH:MM:SS" as UTC; throws std::invalid_argument
    static std::chrono::system_clock::time_point fromUtc(const std::string& text);

private:
    std::chrono::system_clock::time_point simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    bool frozen_;
};

} // namespace nearme::sim
