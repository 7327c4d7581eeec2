/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async API) implementation of IMqttClient
 *
 * Used by the desktop CLI when the relay runs across processes. Relay
 * messages are best effort, so publishing while disconnected fails
 * immediately instead of buffering.
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <mutex>
#include <string>
#include <cstdint>

namespace nearme {

class PahoMqttClient : public IMqttClient {
public:
    /// Not connected after construction; call connect()
    PahoMqttClient();

    /// Disconnects if still connected
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

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

private:
    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 10;

    bool createClient(const std::string& serverURI, const std::string& clientId);

    MQTTAsync client_;
    std::atomic<bool> connected_{false};

    // Connect options point into these
    std::string username_;
    std::string password_;
    TlsConfig tlsConfig_;

    std::mutex callbackMutex_;
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);

    void reportConnection(bool connected, const std::string& reason);

    /// Checks that every configured PEM file is readable
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace nearme
