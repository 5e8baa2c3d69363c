#pragma once

#include "../IMqttClient.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace iotpipe::sim {

struct ConnectRecord {
    std::string host;
    std::uint16_t port = 0;
    std::string clientId;
    std::string username;
    std::string password;
    TlsConfig tls;
    bool withCertificate = false;
};

struct PendingRequest {
    enum class Type { Publish, Subscribe, Unsubscribe };
    Type type;
    std::string topic;
    IMqttClient::CompletionCallback onComplete;
};

/**
 * @brief In-memory IMqttClient for tests
 *
 * Callbacks fire synchronously on the calling thread. By default connects
 * succeed immediately and every request is acknowledged at once; switch
 * either off to drive completions by hand.
 */
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient() = default;
    ~MockMqttClient() override = default;

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
    bool isConnected() const override { return connected_; }

    bool publish(const std::string& topic, const std::string& payload,
                 int qos, bool retained, CompletionCallback onComplete) override;
    bool subscribe(const std::string& topic, int qos, CompletionCallback onComplete) override;
    bool unsubscribe(const std::string& topic, CompletionCallback onComplete) override;

    void setMessageCallback(MessageCallback callback) override { messageCallback_ = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override { connectionCallback_ = std::move(callback); }

    // Mock-specific methods for testing
    void setAutoConnect(bool autoConnect) { autoConnect_ = autoConnect; }
    void setRefuseConnect(bool refuse) { refuseConnect_ = refuse; }
    void setConnectFailureReason(std::string reason) { connectFailure_ = std::move(reason); }
    void setAutoAck(bool autoAck) { autoAck_ = autoAck; }
    void setRejectRequests(bool reject) { rejectRequests_ = reject; }
    void setFailRequests(bool fail) { failRequests_ = fail; }

    /// Finish a connect started with auto-connect off
    void completeConnect(bool success, const std::string& reason = "");

    /// Finish the oldest pending request; false if there is none
    bool completeNext(bool success, const std::string& reason = "");
    void completeAll(bool success, const std::string& reason = "");

    void injectMessage(const std::string& topic, const std::string& payload);
    void simulateConnectionLoss(const std::string& reason = "Connection lost");

    const std::vector<ConnectRecord>& connects() const { return connects_; }
    const std::vector<MqttMessage>& publishedMessages() const { return published_; }
    const std::vector<std::string>& subscriptions() const { return subscriptions_; }
    const std::vector<std::string>& unsubscriptions() const { return unsubscriptions_; }
    const std::vector<PendingRequest>& pendingRequests() const { return pending_; }
    std::size_t disconnectCount() const { return disconnects_; }
    bool hasConnectionCallback() const { return static_cast<bool>(connectionCallback_); }
    bool hasMessageCallback() const { return static_cast<bool>(messageCallback_); }

    void clearPublishedMessages() { published_.clear(); }

private:
    bool startConnect(ConnectRecord record);
    bool accept(PendingRequest::Type type, const std::string& topic, CompletionCallback onComplete);
    void notifyConnection(bool connected, const std::string& reason);

    bool connected_ = false;
    bool connecting_ = false;
    bool autoConnect_ = true;
    bool refuseConnect_ = false;
    std::string connectFailure_;
    bool autoAck_ = true;
    bool rejectRequests_ = false;
    bool failRequests_ = false;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    std::vector<ConnectRecord> connects_;
    std::vector<MqttMessage> published_;
    std::vector<std::string> subscriptions_;
    std::vector<std::string> unsubscriptions_;
    std::vector<PendingRequest> pending_;
    std::size_t disconnects_ = 0;
};

} // namespace iotpipe::sim
