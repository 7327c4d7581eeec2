#include "SimulatedClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace nearme::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime, bool frozen)
    : simulatedTime_(startTime), realStartTime_(std::chrono::steady_clock::now()), frozen_(frozen) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    if (frozen_) {
        return simulatedTime_;
    }

    // Simulated time plus real time elapsed since the last adjustment
    auto realElapsed = std::chrono::steady_clock::now() - realStartTime_;
    return simulatedTime_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(realElapsed);
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    simulatedTime_ = now() + duration;
    realStartTime_ = std::chrono::steady_clock::now();
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now();
}

void SimulatedClock::freezeTime() {
    simulatedTime_ = now();
    frozen_ = true;
}

void SimulatedClock::unfreezeTime() {
    realStartTime_ = std::chrono::steady_clock::now();
    frozen_ = false;
}

std::chrono::system_clock::time_point SimulatedClock::fromUtc(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("invalid UTC time: " + text);
    }
#ifdef _WIN32
    return std::chrono::system_clock::from_time_t(_mkgmtime(&tm));
#else
    return std::chrono::system_clock::from_time_t(timegm(&tm));
#endif
}

} // namespace nearme::sim
