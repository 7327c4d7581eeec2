#include <gtest/gtest.h>
#include "../core/adapters/MqttRelayBridge.hpp"
#include "../core/adapters/MqttRelayPort.hpp"
#include "../core/domain/RelayReceivePort.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/JsonCodec.hpp"
#include <memory>
#include <vector>

using namespace nearme;

class MqttRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        mqtt_ = std::make_shared<sim::MockMqttClient>();
        registry_ = std::make_shared<domain::PortRegistry>();

        port_ = std::make_shared<domain::RelayReceivePort>();
        port_->listen([this](const TransitionEvent& event) { received_.push_back(event); });
        registry_->registerPortWithName(port_, domain::kGeofenceRelayPortName);
    }

    std::string relayTopic() const {
        return adapters::MqttRelayPort::topicFor(domain::kGeofenceRelayPortName);
    }

    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::shared_ptr<domain::PortRegistry> registry_;
    std::shared_ptr<domain::RelayReceivePort> port_;
    std::vector<TransitionEvent> received_;
};

TEST_F(MqttRelayTest, TopicDerivedFromPortName) {
    EXPECT_EQ(relayTopic(), "nearme/relay/nearme_geofence_port");
}

TEST_F(MqttRelayTest, SendPublishesOnceAtQosZero) {
    mqtt_->connect("localhost", 1883, "nearme-bg", "", "");
    adapters::MqttRelayPort sender(mqtt_, domain::kGeofenceRelayPortName);

    EXPECT_TRUE(sender.send({"a::Home", TransitionKind::Enter, "2024-05-01T12:00:00.000Z"}));

    const auto& published = mqtt_->getPublishedMessages();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].topic, relayTopic());
    EXPECT_EQ(published[0].qos, 0);
    EXPECT_FALSE(published[0].retained);

    auto decoded = JsonCodec::decodeTransition(published[0].payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->geofenceKey, "a::Home");
}

TEST_F(MqttRelayTest, SendWhileDisconnectedIsDropped) {
    adapters::MqttRelayPort sender(mqtt_, domain::kGeofenceRelayPortName);

    EXPECT_FALSE(sender.send({"a::Home", TransitionKind::Enter, ""}));
    EXPECT_TRUE(mqtt_->getPublishedMessages().empty());
}

TEST_F(MqttRelayTest, BridgeForwardsToRegisteredPort) {
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();
    mqtt_->connect("localhost", 1883, "nearme-fg", "", "");
    EXPECT_TRUE(bridge.isSubscribed());

    mqtt_->injectMessage(relayTopic(),
                         JsonCodec::encodeTransition({"a::Home", TransitionKind::Enter, "t"}));
    mqtt_->processEvents();

    EXPECT_EQ(bridge.forwarded(), 1u);
    EXPECT_EQ(port_->processEvents(), 1u);
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].kind, TransitionKind::Enter);
}

TEST_F(MqttRelayTest, BridgeIgnoresMalformedPayloads) {
    mqtt_->connect("localhost", 1883, "nearme-fg", "", "");
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();

    mqtt_->injectMessage(relayTopic(), "not json");
    mqtt_->injectMessage(relayTopic(), R"({"id": "a::Home", "event": "dwell"})");
    mqtt_->processEvents();

    EXPECT_EQ(bridge.ignored(), 2u);
    EXPECT_EQ(bridge.forwarded(), 0u);
    EXPECT_EQ(port_->pending(), 0u);
}

TEST_F(MqttRelayTest, BridgeWithoutRegisteredPortDropsEvents) {
    registry_->removePortNameMapping(domain::kGeofenceRelayPortName);
    mqtt_->connect("localhost", 1883, "nearme-fg", "", "");
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();

    mqtt_->injectMessage(relayTopic(),
                         JsonCodec::encodeTransition({"a::Home", TransitionKind::Exit, ""}));
    EXPECT_NO_THROW(mqtt_->processEvents());
    EXPECT_EQ(bridge.forwarded(), 0u);
}

TEST_F(MqttRelayTest, BridgeResubscribesAfterReconnect) {
    mqtt_->connect("localhost", 1883, "nearme-fg", "", "");
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();

    mqtt_->simulateConnectionLoss();
    EXPECT_FALSE(bridge.isSubscribed());

    mqtt_->simulateConnectionRestore();
    EXPECT_TRUE(bridge.isSubscribed());
    ASSERT_EQ(mqtt_->getSubscriptions().size(), 1u);
    EXPECT_EQ(mqtt_->getSubscriptions()[0], relayTopic());
}

TEST_F(MqttRelayTest, StopUnsubscribes) {
    mqtt_->connect("localhost", 1883, "nearme-fg", "", "");
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();
    bridge.stop();

    EXPECT_FALSE(bridge.isSubscribed());
    EXPECT_TRUE(mqtt_->getSubscriptions().empty());
}

TEST_F(MqttRelayTest, EndToEndThroughSharedBroker) {
    // Background process and foreground process share only the broker
    mqtt_->connect("localhost", 1883, "nearme", "", "");
    adapters::MqttRelayBridge bridge(mqtt_, registry_);
    bridge.start();

    auto backgroundRegistry = std::make_shared<domain::PortRegistry>();
    backgroundRegistry->registerPortWithName(
        std::make_shared<adapters::MqttRelayPort>(mqtt_, domain::kGeofenceRelayPortName),
        domain::kGeofenceRelayPortName);

    auto sender = backgroundRegistry->lookupPortByName(domain::kGeofenceRelayPortName);
    ASSERT_NE(sender, nullptr);
    ASSERT_TRUE(sender->send({"b::Work", TransitionKind::Exit, "t"}));

    const auto& published = mqtt_->getPublishedMessages();
    ASSERT_EQ(published.size(), 1u);
    mqtt_->injectMessage(published[0].topic, published[0].payload);
    mqtt_->processEvents();

    EXPECT_EQ(port_->processEvents(), 1u);
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_[0].geofenceKey, "b::Work");
    EXPECT_EQ(received_[0].kind, TransitionKind::Exit);
}
