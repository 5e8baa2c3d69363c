#include "PahoMqttClient.hpp"
#include <fstream>
#include <iostream>
#include <utility>

namespace iotpipe {

PahoMqttClient::PahoMqttClient(Options options) : options_(options) {}

PahoMqttClient::~PahoMqttClient() {
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        messageCallback_ = nullptr;
        connectionCallback_ = nullptr;
    }
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
        opts.timeout = kDisconnectTimeoutMs;
        int rc = MQTTAsync_disconnect(client_, &opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect during destruction failed, error code: " << rc << std::endl;
        }
    }
    destroyClient();
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password,
                             const TlsConfig& tlsConfig) {
    std::cout << "[MQTT] Connecting to " << host << ":" << port << " as " << clientId << std::endl;
    return startConnect(host, port, clientId, username, &password, tlsConfig, false);
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const TlsConfig& tlsConfig) {
    std::cout << "[MQTT] Connecting with client certificate to " << host << ":" << port << std::endl;
    std::cout << "[MQTT] Client ID: " << clientId << std::endl;
    std::cout << "[MQTT] Cert: " << tlsConfig.certPath << std::endl;

    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }
    return startConnect(host, port, clientId, username, nullptr, tlsConfig, true);
}

bool PahoMqttClient::startConnect(const std::string& host, std::uint16_t port, const std::string& clientId,
                                  const std::string& username, const std::string* password,
                                  const TlsConfig& tlsConfig, bool clientCertificate) {
    if (connected_) {
        std::cerr << "[MQTT] Connect requested while already connected" << std::endl;
        return false;
    }

    // A fresh handle per connection: the client id and host can change between
    // provisioning and the hub.
    destroyClient();

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);
    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to install callbacks, error code: " << rc << std::endl;
        destroyClient();
        return false;
    }

    username_ = username;
    password_ = password ? *password : std::string();
    certPath_ = clientCertificate ? tlsConfig.certPath : std::string();
    keyPath_ = clientCertificate ? tlsConfig.keyPath : std::string();
    keyPassword_ = clientCertificate ? tlsConfig.keyPassword : std::string();
    caPath_ = tlsConfig.caPath;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = options_.keepAliveSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = options_.connectTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    conn_opts.username = username_.c_str();
    if (password) {
        conn_opts.password = password_.c_str();
    }
    conn_opts.ssl = &ssl_opts;

    if (clientCertificate) {
        ssl_opts.keyStore = certPath_.c_str();
        ssl_opts.privateKey = keyPath_.c_str();
        if (!keyPassword_.empty()) {
            ssl_opts.privateKeyPassword = keyPassword_.c_str();
        }
    }
    if (!caPath_.empty()) {
        ssl_opts.trustStore = caPath_.c_str();
    }
    ssl_opts.enableServerCertAuth = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::disconnect() {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
    disc_opts.onSuccess = onDisconnected;
    disc_opts.context = this;

    int rc = MQTTAsync_disconnect(client_, &disc_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained, CompletionCallback onComplete) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    pubmsg.payload = const_cast<char*>(payload.data());
    pubmsg.payloadlen = static_cast<int>(payload.size());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    auto* request = new Request{this, std::move(onComplete)};
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onRequestSuccess;
    opts.onFailure = onRequestFailure;
    opts.context = request;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " rejected, error code: " << rc << std::endl;
        delete request;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos, CompletionCallback onComplete) {
    if (!client_ || !connected_) {
        return false;
    }

    auto* request = new Request{this, std::move(onComplete)};
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onRequestSuccess;
    opts.onFailure = onRequestFailure;
    opts.context = request;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Subscribe to " << topic << " rejected, error code: " << rc << std::endl;
        delete request;
        return false;
    }
    return true;
}

bool PahoMqttClient::unsubscribe(const std::string& topic, CompletionCallback onComplete) {
    if (!client_ || !connected_) {
        return false;
    }

    auto* request = new Request{this, std::move(onComplete)};
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onRequestSuccess;
    opts.onFailure = onRequestFailure;
    opts.context = request;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Unsubscribe from " << topic << " rejected, error code: " << rc << std::endl;
        delete request;
        return false;
    }
    return true;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::destroyClient() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
    connected_ = false;
}

void PahoMqttClient::notifyConnection(bool connected, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, reason);
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen)) : std::string(topicName);
    msg.payload = std::string(static_cast<const char*>(message->payload),
                              static_cast<std::size_t>(message->payloadlen));
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
        callback(msg);
    }
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* /*response*/) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    std::cout << "[MQTT] Connected" << std::endl;
    client->notifyConnection(true, "Connected successfully");
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    std::string reason = failureReason("Connection failed", response);
    std::cerr << "[MQTT] " << reason << std::endl;
    client->notifyConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << std::endl;
    client->notifyConnection(false, reason);
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* /*response*/) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    std::cout << "[MQTT] Disconnected" << std::endl;
    client->notifyConnection(false, "Disconnected");
}

void PahoMqttClient::onRequestSuccess(void* context, MQTTAsync_successData* /*response*/) {
    auto* request = static_cast<Request*>(context);
    if (request->onComplete) {
        request->onComplete(true, std::string());
    }
    delete request;
}

void PahoMqttClient::onRequestFailure(void* context, MQTTAsync_failureData* response) {
    auto* request = static_cast<Request*>(context);
    if (request->onComplete) {
        request->onComplete(false, failureReason("Request failed", response));
    }
    delete request;
}

std::string PahoMqttClient::failureReason(const char* fallback, const MQTTAsync_failureData* response) {
    std::string reason = fallback;
    if (response) {
        reason += ": return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    return reason;
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    std::ifstream certFile(tlsConfig.certPath);
    if (!certFile.good()) {
        std::cerr << "[MQTT] ERROR: Certificate file not found: " << tlsConfig.certPath << std::endl;
        return false;
    }

    std::ifstream keyFile(tlsConfig.keyPath);
    if (!keyFile.good()) {
        std::cerr << "[MQTT] ERROR: Private key file not found: " << tlsConfig.keyPath << std::endl;
        return false;
    }

    if (!tlsConfig.caPath.empty()) {
        std::ifstream caFile(tlsConfig.caPath);
        if (!caFile.good()) {
            std::cerr << "[MQTT] ERROR: CA file not found: " << tlsConfig.caPath << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace iotpipe
