#pragma once

#include "../IMqttClient.hpp"
#include "../domain/PortRegistry.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace nearme::adapters {

/**
 * @brief Foreground end of the cross-process relay
 *
 * Subscribes to the relay topic whenever the client (re)connects and hands
 * every decoded transition to the port currently registered under the same
 * name. Payloads that do not decode are ignored.
 */
class MqttRelayBridge {
public:
    MqttRelayBridge(std::shared_ptr<IMqttClient> mqttClient,
                    std::shared_ptr<domain::PortRegistry> registry,
                    std::string portName = domain::kGeofenceRelayPortName);
    ~MqttRelayBridge();

    MqttRelayBridge(const MqttRelayBridge&) = delete;
    MqttRelayBridge& operator=(const MqttRelayBridge&) = delete;

    /// Installs the client callbacks and subscribes if already connected
    void start();
    void stop();

    bool isSubscribed() const { return subscribed_; }
    size_t forwarded() const { return forwarded_; }
    size_t ignored() const { return ignored_; }

private:
    void onMessage(const MqttMessage& message);
    void onConnection(bool connected, const std::string& reason);
    void subscribe();

    std::shared_ptr<IMqttClient> mqttClient_;
    std::shared_ptr<domain::PortRegistry> registry_;
    std::string portName_;
    std::string topic_;

    std::atomic<bool> subscribed_{false};
    std::atomic<size_t> forwarded_{0};
    std::atomic<size_t> ignored_{0};
};

} // namespace nearme::adapters
