#include "MqttRelayPort.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace nearme::adapters {

MqttRelayPort::MqttRelayPort(std::shared_ptr<IMqttClient> mqttClient, std::string portName)
    : mqttClient_(mqttClient), topic_(topicFor(portName)) {
}

bool MqttRelayPort::send(const TransitionEvent& event) {
    if (!mqttClient_->isConnected()) {
        std::cerr << "[Relay] Not connected, dropping " << event.geofenceKey << std::endl;
        return false;
    }
    return mqttClient_->publish(topic_, JsonCodec::encodeTransition(event), 0, false);
}

std::string MqttRelayPort::topicFor(const std::string& portName) {
    return kRelayTopicPrefix + portName;
}

} // namespace nearme::adapters
