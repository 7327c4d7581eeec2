#pragma once

#include "../IMqttClient.hpp"
#include "../ports/ISendPort.hpp"
#include <memory>
#include <string>

namespace nearme::adapters {

/// Prefix of the broker topics that carry relayed transitions
constexpr const char* kRelayTopicPrefix = "nearme/relay/";

/**
 * Sending half of the cross-process relay. Publishes each transition once at
 * QoS 0, not retained: with no subscriber the broker drops it.
 */
class MqttRelayPort : public ports::ISendPort {
public:
    MqttRelayPort(std::shared_ptr<IMqttClient> mqttClient, std::string portName);
    ~MqttRelayPort() override = default;

    bool send(const TransitionEvent& event) override;

    const std::string& topic() const { return topic_; }

    static std::string topicFor(const std::string& portName);

private:
    std::shared_ptr<IMqttClient> mqttClient_;
    std::string topic_;
};

} // namespace nearme::adapters
