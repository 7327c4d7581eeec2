#include "SimulatedLocationProvider.hpp"
#include <stdexcept>

namespace nearme::sim {

bool SimulatedLocationProvider::isLocationServiceEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serviceEnabled_;
}

bool SimulatedLocationProvider::supportsAccuracyStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supportsAccuracy_;
}

ports::LocationAccuracyStatus SimulatedLocationProvider::accuracyStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accuracy_;
}

Location SimulatedLocationProvider::currentPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!serviceEnabled_) {
        throw std::runtime_error("location services are disabled");
    }
    if (currentPositionError_) {
        throw std::runtime_error(*currentPositionError_);
    }
    if (!position_) {
        throw std::runtime_error("no position fix available");
    }
    return *position_;
}

void SimulatedLocationProvider::startPositionStream(const ports::PositionStreamSettings& settings,
                                                    PositionCallback onPosition,
                                                    ErrorCallback onError) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::queue<StreamItem>().swap(queue_);
    settings_ = settings;
    onPosition_ = std::move(onPosition);
    onError_ = std::move(onError);
    streaming_ = true;
    streamStarts_++;
}

void SimulatedLocationProvider::stopPositionStream() {
    std::lock_guard<std::mutex> lock(mutex_);
    streaming_ = false;
    onPosition_ = nullptr;
    onError_ = nullptr;
    std::queue<StreamItem>().swap(queue_);
}

void SimulatedLocationProvider::processEvents() {
    while (true) {
        StreamItem item;
        PositionCallback onPosition;
        ErrorCallback onError;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!streaming_ || queue_.empty()) {
                return;
            }
            item = std::move(queue_.front());
            queue_.pop();
            onPosition = onPosition_;
            onError = onError_;
        }

        if (auto* location = std::get_if<Location>(&item)) {
            if (onPosition) {
                onPosition(*location);
            }
        } else if (onError) {
            onError(std::get<std::string>(item));
        }
    }
}

void SimulatedLocationProvider::setServiceEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    serviceEnabled_ = enabled;
}

void SimulatedLocationProvider::setSupportsAccuracyStatus(bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    supportsAccuracy_ = supported;
}

void SimulatedLocationProvider::setAccuracyStatus(ports::LocationAccuracyStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    accuracy_ = status;
}

void SimulatedLocationProvider::setPosition(const Location& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = position;
}

void SimulatedLocationProvider::clearPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    position_.reset();
}

void SimulatedLocationProvider::setCurrentPositionError(std::optional<std::string> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentPositionError_ = std::move(error);
}

void SimulatedLocationProvider::pushPosition(const Location& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = position;
    if (streaming_) {
        queue_.push(position);
    }
}

void SimulatedLocationProvider::pushError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (streaming_) {
        queue_.push(error);
    }
}

bool SimulatedLocationProvider::isStreaming() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streaming_;
}

int SimulatedLocationProvider::streamStarts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streamStarts_;
}

std::optional<ports::PositionStreamSettings> SimulatedLocationProvider::streamSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

size_t SimulatedLocationProvider::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace nearme::sim
