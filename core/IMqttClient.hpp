/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used by the cross-process transition relay
 *
 * The background invocation and the foreground monitor can live in separate
 * processes. This interface lets them meet on a broker without the core
 * depending on a concrete MQTT library.
 */

#pragma once

#include <string>
#include <functional>
#include <cstdint>

namespace nearme {

/**
 * @brief One MQTT message, inbound or outbound
 *
 * QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once).
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "nearme/relay/nearme_geofence_port"
    std::string payload;            ///< JSON transition record
    int qos = 0;
    bool retained = false;
};

/**
 * @brief TLS settings for brokers that require them
 *
 * @note Certificate and key files must be PEM
 */
struct TlsConfig {
    std::string certPath;          ///< Client certificate; empty for server-auth only
    std::string keyPath;           ///< Client private key
    std::string caPath;            ///< Root CA used to verify the broker
    bool verifyServer = true;
};

/**
 * @brief Platform-independent MQTT client
 *
 * Connection is asynchronous: connect() only starts it and the connection
 * callback reports the outcome. Callbacks may run on the client library's
 * own thread.
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Connect over plain TCP
     * @param username Empty for anonymous brokers
     * @return true if the attempt was started
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password) = 0;

    /**
     * @brief Connect over TLS
     * @return true if the attempt was started
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                               const std::string& clientId,
                               const std::string& username,
                               const TlsConfig& tlsConfig) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish to a topic
     * @return false when not connected; nothing is queued for later
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /// Non-blocking; implementations with their own network thread may do nothing
    virtual void processEvents() = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace nearme
