#include "PahoMqttClient.hpp"
#include <iostream>
#include <fstream>

namespace nearme {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::createClient(const std::string& serverURI, const std::string& clientId) {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    return true;
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                            const std::string& clientId,
                            const std::string& username,
                            const std::string& password) {

    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << clientId << std::endl;

    if (!createClient(serverURI, clientId)) {
        return false;
    }

    username_ = username;
    password_ = password;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!username_.empty()) {
        conn_opts.username = username_.c_str();
        conn_opts.password = password_.c_str();
    }

    int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                   const std::string& clientId,
                                   const std::string& username,
                                   const TlsConfig& tlsConfig) {

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting with TLS to " << serverURI << " as " << clientId << std::endl;

    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }
    if (!createClient(serverURI, clientId)) {
        return false;
    }

    username_ = username;
    tlsConfig_ = tlsConfig;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!username_.empty()) {
        conn_opts.username = username_.c_str();
    }
    conn_opts.ssl = &ssl_opts;

    if (!tlsConfig_.certPath.empty()) {
        ssl_opts.keyStore = tlsConfig_.certPath.c_str();
        ssl_opts.privateKey = tlsConfig_.keyPath.c_str();
    }
    if (!tlsConfig_.caPath.empty()) {
        ssl_opts.trustStore = tlsConfig_.caPath.c_str();
    }
    ssl_opts.enableServerCertAuth = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig_.verifyServer ? 1 : 0;
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;

    int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::processEvents() {
    // Paho's async API runs its own network thread
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
    msg.qos = message->qos;
    msg.retained = message->retained != 0;

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->messageCallback_;
    }
    if (callback) {
        try {
            callback(msg);
        } catch (const std::exception& e) {
            std::cerr << "[MQTT] Message handler failed on " << msg.topic << ": " << e.what() << std::endl;
        }
    }
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    client->reportConnection(true, "Connected successfully");
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    client->reportConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    client->reportConnection(false, cause ? std::string(cause) : "Connection lost");
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::reportConnection(bool connected, const std::string& reason) {
    std::cout << "[MQTT] " << (connected ? "Connected" : "Disconnected") << ": " << reason << std::endl;

    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, reason);
    }
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    for (const auto& path : {tlsConfig.certPath, tlsConfig.keyPath, tlsConfig.caPath}) {
        if (path.empty()) {
            continue;
        }
        std::ifstream file(path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: Certificate file not found: " << path << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace nearme
