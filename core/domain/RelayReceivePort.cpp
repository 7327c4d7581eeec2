#include "RelayReceivePort.hpp"
#include <iostream>

namespace nearme::domain {

bool RelayReceivePort::send(const TransitionEvent& event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (closed_) {
        return false;
    }
    queue_.push(event);
    return true;
}

void RelayReceivePort::listen(Listener listener) {
    listener_ = std::move(listener);
}

size_t RelayReceivePort::processEvents() {
    if (processing_ || !listener_) return 0; // Listener may re-enter

    processing_ = true;
    size_t delivered = 0;

    while (true) {
        TransitionEvent event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) break;

            event = std::move(queue_.front());
            queue_.pop();
        }

        try {
            listener_(event);
            delivered++;
        } catch (const std::exception& e) {
            std::cerr << "[Relay] Listener failed for " << event.geofenceKey << ": " << e.what() << std::endl;
        }
    }

    processing_ = false;
    return delivered;
}

void RelayReceivePort::close() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    closed_ = true;
    std::queue<TransitionEvent>().swap(queue_);
}

bool RelayReceivePort::isClosed() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return closed_;
}

size_t RelayReceivePort::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

} // namespace nearme::domain
