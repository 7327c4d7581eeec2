#include "MockMqttClient.hpp"
#include <algorithm>

namespace nearme::sim {

MockMqttClient::MockMqttClient() = default;

bool MockMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password) {
    (void)username;
    (void)password;
    return recordConnect(host, port, clientId);
}

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const TlsConfig& tlsConfig) {
    (void)username;
    (void)tlsConfig;
    return recordConnect(host, port, clientId);
}

bool MockMqttClient::recordConnect(const std::string& host, std::uint16_t port, const std::string& clientId) {
    lastHost_ = host;
    lastPort_ = port;
    lastClientId_ = clientId;
    setConnected(true);
    return true;
}

void MockMqttClient::disconnect() {
    setConnected(false);
}

bool MockMqttClient::isConnected() const {
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool retained) {
    if (!connected_ || failPublish_) {
        return false;
    }

    MockMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;
    msg.timestamp = std::chrono::steady_clock::now();

    publishedMessages_.push_back(msg);
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    if (!connected_ || failSubscribe_) return false;

    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return true;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    auto it = std::find(subscriptions_.begin(), subscriptions_.end(), topic);
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::processEvents() {
    while (!incomingMessages_.empty()) {
        auto msg = incomingMessages_.front();
        incomingMessages_.pop();

        bool subscribed = std::find(subscriptions_.begin(), subscriptions_.end(), msg.topic) !=
                          subscriptions_.end();
        if (subscribed && messageCallback_) {
            messageCallback_({msg.topic, msg.payload, msg.qos, msg.retained});
        }
    }
}

void MockMqttClient::setConnected(bool connected) {
    bool wasConnected = connected_;
    connected_ = connected;

    if (!connected) {
        subscriptions_.clear();
    }
    if (connectionCallback_ && wasConnected != connected) {
        connectionCallback_(connected, connected ? "Connected" : "Disconnected");
    }
}

void MockMqttClient::simulateConnectionLoss() {
    setConnected(false);
}

void MockMqttClient::simulateConnectionRestore() {
    setConnected(true);
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    MockMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.timestamp = std::chrono::steady_clock::now();

    incomingMessages_.push(msg);
}

} // namespace nearme::sim
