#include "MockMqttClient.hpp"
#include <utility>

namespace iotpipe::sim {

bool MockMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password,
                             const TlsConfig& tlsConfig) {
    ConnectRecord record;
    record.host = host;
    record.port = port;
    record.clientId = clientId;
    record.username = username;
    record.password = password;
    record.tls = tlsConfig;
    return startConnect(std::move(record));
}

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const std::string& username,
                                    const TlsConfig& tlsConfig) {
    ConnectRecord record;
    record.host = host;
    record.port = port;
    record.clientId = clientId;
    record.username = username;
    record.tls = tlsConfig;
    record.withCertificate = true;
    return startConnect(std::move(record));
}

bool MockMqttClient::startConnect(ConnectRecord record) {
    connects_.push_back(std::move(record));
    if (refuseConnect_) {
        return false;
    }

    connecting_ = true;
    if (autoConnect_) {
        completeConnect(connectFailure_.empty(), connectFailure_);
    }
    return true;
}

void MockMqttClient::completeConnect(bool success, const std::string& reason) {
    if (!connecting_) {
        return;
    }
    connecting_ = false;
    connected_ = success;
    notifyConnection(success, success ? "Mock connection established" : reason);
}

bool MockMqttClient::disconnect() {
    if (!connected_) {
        return false;
    }
    ++disconnects_;
    connected_ = false;
    notifyConnection(false, "Disconnected");
    return true;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained, CompletionCallback onComplete) {
    if (!connected_ || rejectRequests_) {
        return false;
    }

    MqttMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;
    published_.push_back(msg);

    return accept(PendingRequest::Type::Publish, topic, std::move(onComplete));
}

bool MockMqttClient::subscribe(const std::string& topic, int /*qos*/, CompletionCallback onComplete) {
    if (!connected_ || rejectRequests_) {
        return false;
    }
    subscriptions_.push_back(topic);
    return accept(PendingRequest::Type::Subscribe, topic, std::move(onComplete));
}

bool MockMqttClient::unsubscribe(const std::string& topic, CompletionCallback onComplete) {
    if (!connected_ || rejectRequests_) {
        return false;
    }
    unsubscriptions_.push_back(topic);
    return accept(PendingRequest::Type::Unsubscribe, topic, std::move(onComplete));
}

bool MockMqttClient::accept(PendingRequest::Type type, const std::string& topic, CompletionCallback onComplete) {
    if (autoAck_) {
        if (onComplete) {
            onComplete(!failRequests_, failRequests_ ? "Mock request failure" : "");
        }
        return true;
    }
    pending_.push_back(PendingRequest{type, topic, std::move(onComplete)});
    return true;
}

bool MockMqttClient::completeNext(bool success, const std::string& reason) {
    if (pending_.empty()) {
        return false;
    }
    PendingRequest request = std::move(pending_.front());
    pending_.erase(pending_.begin());
    if (request.onComplete) {
        request.onComplete(success, reason);
    }
    return true;
}

void MockMqttClient::completeAll(bool success, const std::string& reason) {
    while (completeNext(success, reason)) {
    }
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    if (messageCallback_) {
        MqttMessage msg;
        msg.topic = topic;
        msg.payload = payload;
        msg.qos = 1;
        messageCallback_(msg);
    }
}

void MockMqttClient::simulateConnectionLoss(const std::string& reason) {
    if (!connected_) {
        return;
    }
    connected_ = false;
    notifyConnection(false, reason);
}

void MockMqttClient::notifyConnection(bool connected, const std::string& reason) {
    if (connectionCallback_) {
        connectionCallback_(connected, reason);
    }
}

} // namespace iotpipe::sim
