/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Every connection runs over TLS. Token authentication passes the SAS token
 * as the MQTT password; certificate authentication hands the PEM files to
 * the TLS layer. Each publish, subscribe and unsubscribe reports its own
 * outcome through the CompletionCallback supplied with the request.
 *
 * @note Callbacks run on Paho's internal threads
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace iotpipe {

class PahoMqttClient : public IMqttClient {
public:
    struct Options {
        int keepAliveSeconds = 240;             ///< Azure IoT Hub recommended keep-alive
        int connectTimeoutSeconds = 30;
    };

    PahoMqttClient() : PahoMqttClient(Options{}) {}
    explicit PahoMqttClient(Options options);

    /// Disconnects synchronously (bounded wait) and destroys the Paho handle
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const std::string& host, std::uint16_t port,
                 const std::string& clientId,
                 const std::string& username,
                 const std::string& password,
                 const TlsConfig& tlsConfig) override;

    bool connectWithTls(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const TlsConfig& tlsConfig) override;

    bool disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos, bool retained, CompletionCallback onComplete) override;
    bool subscribe(const std::string& topic, int qos, CompletionCallback onComplete) override;
    bool unsubscribe(const std::string& topic, CompletionCallback onComplete) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Heap context handed to Paho for one request, freed by whichever callback fires
    struct Request {
        PahoMqttClient* client;
        CompletionCallback onComplete;
    };

    static constexpr int kDisconnectTimeoutMs = 2000;

    bool startConnect(const std::string& host, std::uint16_t port, const std::string& clientId,
                      const std::string& username, const std::string* password, const TlsConfig& tlsConfig,
                      bool clientCertificate);
    void destroyClient();
    void notifyConnection(bool connected, const std::string& reason);

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void connectionLost(void* context, char* cause);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static void onRequestSuccess(void* context, MQTTAsync_successData* response);
    static void onRequestFailure(void* context, MQTTAsync_failureData* response);

    static std::string failureReason(const char* fallback, const MQTTAsync_failureData* response);

    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;

    Options options_;
    MQTTAsync client_ = nullptr;
    std::atomic<bool> connected_{false};

    // Paho keeps pointers into these until the connect completes
    std::string username_;
    std::string password_;
    std::string certPath_;
    std::string keyPath_;
    std::string keyPassword_;
    std::string caPath_;

    mutable std::mutex callbackMutex_;
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
};

} // namespace iotpipe
