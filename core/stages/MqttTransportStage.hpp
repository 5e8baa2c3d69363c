/**
 * @file MqttTransportStage.hpp
 * @brief Terminal stage driving an IMqttClient
 *
 * Stores connection arguments and credentials, connects with a SAS token
 * password or an X.509 client certificate, and maps publish, subscribe and
 * unsubscribe onto the client with delivery callbacks. Client callbacks
 * arrive on the client's threads and are posted onto the pipeline executor.
 */

#pragma once

#include "../IMqttClient.hpp"
#include "../pipeline/Stage.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace iotpipe::stages {

class MqttTransportStage : public pipeline::Stage {
public:
    struct Options {
        std::uint16_t port = 8883;
        TlsConfig tls;                  ///< caPath and verifyServer; client certificate comes from the pipeline
    };

    explicit MqttTransportStage(std::shared_ptr<IMqttClient> client) : MqttTransportStage(std::move(client), Options{}) {}
    MqttTransportStage(std::shared_ptr<IMqttClient> client, Options options);
    ~MqttTransportStage() override;

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onAttached() override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    void connect(const pipeline::OperationPtr& op);
    void disconnect(const pipeline::OperationPtr& op);
    void startRequest(const pipeline::OperationPtr& op);
    IMqttClient::CompletionCallback completionFor(std::uint64_t opId);

    void onConnectionChanged(bool connected, const std::string& reason);
    void onRequestDone(std::uint64_t opId, bool success, const std::string& reason);
    void failInFlight(const pipeline::Error& error);

    std::shared_ptr<IMqttClient> client_;
    Options options_;
    std::optional<pipeline::ops::SetMqttConnectionArgs> args_;
    pipeline::OperationPtr pendingConnect_;
    pipeline::OperationPtr pendingDisconnect_;
    std::map<std::uint64_t, pipeline::OperationPtr> inFlight_;
};

} // namespace iotpipe::stages
