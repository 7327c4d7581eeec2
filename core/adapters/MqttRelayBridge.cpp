#include "MqttRelayBridge.hpp"
#include "MqttRelayPort.hpp"
#include "../JsonCodec.hpp"
#include <iostream>

namespace nearme::adapters {

MqttRelayBridge::MqttRelayBridge(std::shared_ptr<IMqttClient> mqttClient,
                                 std::shared_ptr<domain::PortRegistry> registry,
                                 std::string portName)
    : mqttClient_(mqttClient), registry_(registry), portName_(std::move(portName)),
      topic_(MqttRelayPort::topicFor(portName_)) {
}

MqttRelayBridge::~MqttRelayBridge() {
    stop();
}

void MqttRelayBridge::start() {
    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        onMessage(msg);
    });

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onConnection(connected, reason);
    });

    if (mqttClient_->isConnected()) {
        subscribe();
    }
}

void MqttRelayBridge::stop() {
    if (subscribed_.exchange(false)) {
        mqttClient_->unsubscribe(topic_);
    }
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

void MqttRelayBridge::onMessage(const MqttMessage& message) {
    if (message.topic != topic_) {
        return;
    }

    auto event = JsonCodec::decodeTransition(message.payload);
    if (!event) {
        ignored_++;
        std::cerr << "[Relay] Ignoring malformed payload on " << message.topic << std::endl;
        return;
    }

    auto port = registry_->lookupPortByName(portName_);
    if (!port || !port->send(*event)) {
        return;
    }
    forwarded_++;
}

void MqttRelayBridge::onConnection(bool connected, const std::string& reason) {
    if (connected) {
        subscribe();
    } else {
        subscribed_ = false;
        std::cerr << "[Relay] Broker connection lost: " << reason << std::endl;
    }
}

void MqttRelayBridge::subscribe() {
    if (mqttClient_->subscribe(topic_, 0)) {
        subscribed_ = true;
        std::cout << "[Relay] Listening on " << topic_ << std::endl;
    } else {
        std::cerr << "[Relay] Subscribe to " << topic_ << " failed" << std::endl;
    }
}

} // namespace nearme::adapters
