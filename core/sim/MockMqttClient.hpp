#pragma once

#include "../IMqttClient.hpp"
#include <chrono>
#include <queue>
#include <string>
#include <vector>

namespace nearme::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
    bool retained = false;
    std::chrono::steady_clock::time_point timestamp;
};

class MockMqttClient : public IMqttClient {
public:
    MockMqttClient();
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connect(const std::string& host, std::uint16_t port,
                const std::string& clientId,
                const std::string& username,
                const std::string& password) override;
    bool connectWithTls(const std::string& host, std::uint16_t port,
                       const std::string& clientId,
                       const std::string& username,
                       const TlsConfig& tlsConfig) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override;

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void simulateConnectionLoss();
    void simulateConnectionRestore();
    /// Queued until processEvents(); only delivered for subscribed topics
    void injectMessage(const std::string& topic, const std::string& payload);

    const std::vector<MockMessage>& getPublishedMessages() const { return publishedMessages_; }
    void clearPublishedMessages() { publishedMessages_.clear(); }
    const std::vector<std::string>& getSubscriptions() const { return subscriptions_; }
    const std::string& lastHost() const { return lastHost_; }
    std::uint16_t lastPort() const { return lastPort_; }
    const std::string& lastClientId() const { return lastClientId_; }

    void setFailPublish(bool fail) { failPublish_ = fail; }
    void setFailSubscribe(bool fail) { failSubscribe_ = fail; }

private:
    bool recordConnect(const std::string& host, std::uint16_t port, const std::string& clientId);

    bool connected_ = false;
    bool failPublish_ = false;
    bool failSubscribe_ = false;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::vector<MockMessage> publishedMessages_;
    std::queue<MockMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;

    std::string lastHost_;
    std::uint16_t lastPort_ = 0;
    std::string lastClientId_;
};

} // namespace nearme::sim
