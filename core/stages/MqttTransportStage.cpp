#include "MqttTransportStage.hpp"
#include "../pipeline/PipelineContext.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace iotpipe::stages {

using namespace pipeline;

MqttTransportStage::MqttTransportStage(std::shared_ptr<IMqttClient> client, Options options)
    : Stage("MqttTransportStage"), client_(std::move(client)), options_(std::move(options)) {
    if (!client_) {
        throw std::invalid_argument("MqttTransportStage: MQTT client cannot be null");
    }
}

MqttTransportStage::~MqttTransportStage() {
    client_->setMessageCallback(nullptr);
    client_->setConnectionCallback(nullptr);
}

void MqttTransportStage::onAttached() {
    std::weak_ptr<ports::IExecutor> executor = context().executorPtr();

    client_->setConnectionCallback([this, executor](bool connected, const std::string& reason) {
        if (auto target = executor.lock()) {
            target->post([this, connected, reason] { onConnectionChanged(connected, reason); });
        }
    });

    client_->setMessageCallback([this, executor](const MqttMessage& message) {
        if (auto target = executor.lock()) {
            target->post([this, message] {
                sendEventUp(makeEvent(events::MessageReceived{message}));
            });
        }
    });
}

void MqttTransportStage::runOp(const OperationPtr& op) {
    if (context().isShuttingDown()) {
        op->complete(Error::shuttingDown());
        return;
    }

    switch (op->kind()) {
        case OperationKind::SetMqttConnectionArgs:
            args_ = op->as<ops::SetMqttConnectionArgs>();
            op->complete();
            return;

        case OperationKind::SetCredentialToken:
            if (!args_) {
                op->complete(Error::configuration("SetCredentialToken before SetMqttConnectionArgs"));
                return;
            }
            args_->sasToken = op->as<ops::SetCredentialToken>().token;
            args_->clientCertificate.reset();
            op->complete();
            return;

        case OperationKind::SetClientCertificate:
            if (!args_) {
                op->complete(Error::configuration("SetClientCertificate before SetMqttConnectionArgs"));
                return;
            }
            args_->clientCertificate = op->as<ops::SetClientCertificate>().certificate;
            args_->sasToken.reset();
            op->complete();
            return;

        case OperationKind::Connect:
            connect(op);
            return;

        case OperationKind::Disconnect:
            disconnect(op);
            return;

        case OperationKind::MqttPublish:
        case OperationKind::MqttSubscribe:
        case OperationKind::MqttUnsubscribe:
            startRequest(op);
            return;

        default:
            passOpToNextStage(op);
            return;
    }
}

void MqttTransportStage::connect(const OperationPtr& op) {
    if (!args_) {
        op->complete(Error::configuration("Connect before SetMqttConnectionArgs"));
        return;
    }
    if (pendingConnect_) {
        op->complete(Error::unexpected("Connect already in progress"));
        return;
    }
    if (client_->isConnected()) {
        op->complete();
        return;
    }

    std::cout << "[Transport] Connecting to " << args_->host << ":" << options_.port
              << " as " << args_->clientId << std::endl;

    pendingConnect_ = op;
    bool started = false;
    if (args_->clientCertificate) {
        TlsConfig tls = options_.tls;
        tls.certPath = args_->clientCertificate->certPath;
        tls.keyPath = args_->clientCertificate->keyPath;
        tls.keyPassword = args_->clientCertificate->passPhrase;
        started = client_->connectWithTls(args_->host, options_.port, args_->clientId, args_->username, tls);
    } else {
        TlsConfig tls = options_.tls;
        tls.certPath.clear();
        tls.keyPath.clear();
        started = client_->connect(args_->host, options_.port, args_->clientId, args_->username,
                                   args_->sasToken.value_or(std::string()), tls);
    }

    if (!started && pendingConnect_ == op) {
        pendingConnect_.reset();
        op->complete(Error::transport("Failed to initiate MQTT connection to " + args_->host));
    }
}

void MqttTransportStage::disconnect(const OperationPtr& op) {
    if (pendingDisconnect_) {
        op->complete(Error::unexpected("Disconnect already in progress"));
        return;
    }
    pendingDisconnect_ = op;
    if (!client_->disconnect() && pendingDisconnect_ == op) {
        pendingDisconnect_.reset();
        op->complete();
    }
}

void MqttTransportStage::startRequest(const OperationPtr& op) {
    if (!client_->isConnected()) {
        op->complete(Error::transport(op->name() + " failed: not connected", true));
        return;
    }

    const std::uint64_t opId = op->id();
    inFlight_.emplace(opId, op);

    bool started = false;
    std::string target;
    if (op->is<ops::MqttPublish>()) {
        const auto& p = op->as<ops::MqttPublish>();
        target = p.topic;
        started = client_->publish(p.topic, p.payload, p.qos, false, completionFor(opId));
    } else if (op->is<ops::MqttSubscribe>()) {
        const auto& p = op->as<ops::MqttSubscribe>();
        target = p.topic;
        started = client_->subscribe(p.topic, p.qos, completionFor(opId));
    } else {
        const auto& p = op->as<ops::MqttUnsubscribe>();
        target = p.topic;
        started = client_->unsubscribe(p.topic, completionFor(opId));
    }

    if (!started && inFlight_.erase(opId) != 0) {
        std::cerr << "[Transport] " << op->name() << " rejected for " << target << std::endl;
        op->complete(Error::transport(op->name() + " rejected by MQTT client for " + target, true));
    }
}

IMqttClient::CompletionCallback MqttTransportStage::completionFor(std::uint64_t opId) {
    std::weak_ptr<ports::IExecutor> executor = context().executorPtr();
    return [this, executor, opId](bool success, const std::string& reason) {
        if (auto target = executor.lock()) {
            target->post([this, opId, success, reason] { onRequestDone(opId, success, reason); });
        }
    };
}

void MqttTransportStage::onRequestDone(std::uint64_t opId, bool success, const std::string& reason) {
    auto it = inFlight_.find(opId);
    if (it == inFlight_.end()) {
        return;
    }
    OperationPtr op = std::move(it->second);
    inFlight_.erase(it);

    if (success) {
        op->complete();
    } else {
        std::cerr << "[Transport] " << op->name() << " failed: " << reason << std::endl;
        op->complete(Error::transport(op->name() + " failed: " + reason, true));
    }
}

void MqttTransportStage::onConnectionChanged(bool connected, const std::string& reason) {
    if (connected) {
        std::cout << "[Transport] Connected" << std::endl;
        if (auto op = std::move(pendingConnect_)) {
            pendingConnect_.reset();
            op->complete();
        }
    } else {
        std::cout << "[Transport] Disconnected: " << reason << std::endl;
        if (auto op = std::move(pendingConnect_)) {
            pendingConnect_.reset();
            op->complete(Error::transport("Connection failed: " + reason, true));
        }
        if (auto op = std::move(pendingDisconnect_)) {
            pendingDisconnect_.reset();
            op->complete();
        }
        failInFlight(Error::transport("Connection lost: " + reason, true));
    }

    sendEventUp(makeEvent(events::ConnectionStateChanged{connected, reason}));
}

void MqttTransportStage::failInFlight(const Error& error) {
    auto inFlight = std::move(inFlight_);
    inFlight_.clear();
    for (auto& entry : inFlight) {
        entry.second->complete(error);
    }
}

void MqttTransportStage::onShutdown(const Error& reason) {
    if (auto op = std::move(pendingConnect_)) {
        pendingConnect_.reset();
        op->complete(reason);
    }
    if (auto op = std::move(pendingDisconnect_)) {
        pendingDisconnect_.reset();
        op->complete(reason);
    }
    failInFlight(reason);

    if (client_->isConnected() && !client_->disconnect()) {
        std::cerr << "[Transport] Disconnect at shutdown was refused by the MQTT client" << std::endl;
    }
}

} // namespace iotpipe::stages
