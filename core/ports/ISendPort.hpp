#pragma once

#include "../Event.hpp"

namespace nearme::ports {

/// Sending half of the background to foreground relay. Never blocks the sender.
class ISendPort {
public:
    virtual ~ISendPort() = default;

    /// Best effort; false when the message was dropped.
    virtual bool send(const TransitionEvent& event) = 0;
};

} // namespace nearme::ports
