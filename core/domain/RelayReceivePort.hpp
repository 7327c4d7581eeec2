#pragma once

#include "../ports/ISendPort.hpp"
#include <functional>
#include <mutex>
#include <queue>

namespace nearme::domain {

/**
 * Foreground end of the relay. send() may be called from any thread and only
 * enqueues; processEvents() delivers on the caller's thread, in arrival order.
 * Messages wait in the queue until a listener is attached.
 */
class RelayReceivePort : public ports::ISendPort {
public:
    using Listener = std::function<void(const TransitionEvent&)>;

    RelayReceivePort() = default;
    ~RelayReceivePort() override = default;

    bool send(const TransitionEvent& event) override;

    void listen(Listener listener);
    size_t processEvents();

    /// Drops everything queued and rejects later sends
    void close();
    bool isClosed() const;
    size_t pending() const;

private:
    Listener listener_;
    std::queue<TransitionEvent> queue_;
    mutable std::mutex queueMutex_;
    bool closed_ = false;
    bool processing_ = false;
};

} // namespace nearme::domain
