/**
 * @file DeviceClient.hpp
 * @brief IoT Hub device client on top of a hub pipeline
 *
 * Wraps operation submission and event dispatch behind plain methods and
 * handler setters. Completions and handlers run on the pipeline's executor
 * thread; handlers must not block it.
 */

#pragma once

#include "IMqttClient.hpp"
#include "Models.hpp"
#include "pipeline/Error.hpp"
#include "pipeline/Pipeline.hpp"
#include "pipeline/PipelineOptions.hpp"
#include "ports/IAuthenticationProvider.hpp"
#include "ports/IExecutor.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace iotpipe {

class DeviceClient {
public:
    using Completion = std::function<void(const std::optional<pipeline::Error>& error)>;
    using TwinCallback = std::function<void(const std::optional<pipeline::Error>& error, const nlohmann::json& twin)>;
    using PatchCallback = std::function<void(const std::optional<pipeline::Error>& error, int version)>;

    using MethodRequestHandler = std::function<void(const MethodRequest& request)>;
    using C2DMessageHandler = std::function<void(const Message& message)>;
    using TwinPatchHandler = std::function<void(const nlohmann::json& patch, int version)>;
    using ConnectionStateHandler = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Build the hub pipeline and hand it the device identity
     * @throws std::invalid_argument on a null collaborator
     */
    DeviceClient(std::shared_ptr<ports::IAuthenticationProvider> authProvider,
                 std::shared_ptr<IMqttClient> mqttClient,
                 std::shared_ptr<ports::IExecutor> executor,
                 const pipeline::PipelineOptions& options = pipeline::PipelineOptions{});

    ~DeviceClient();

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    void connect(Completion done);
    void disconnect(Completion done);

    /// Connects on demand; retried on transport errors
    void sendTelemetry(Message message, Completion done);
    void sendMethodResponse(MethodResponse response, Completion done);

    void getTwin(TwinCallback done);
    void patchReportedProperties(nlohmann::json patch, PatchCallback done);

    void enableMethods(Completion done);
    void enableC2D(Completion done);
    void enableTwinPatches(Completion done);

    void uploadBlob(std::string blobName, std::string content, Completion done);

    /// Push the provider's current SAS token to the transport for the next connect
    void renewToken(Completion done);

    void setMethodRequestHandler(MethodRequestHandler handler);
    void setC2DMessageHandler(C2DMessageHandler handler);
    void setTwinPatchHandler(TwinPatchHandler handler);
    void setConnectionStateHandler(ConnectionStateHandler handler);

    bool isConnected() const { return pipeline_->isConnected(); }
    const std::string& deviceId() const { return deviceId_; }

    void shutdown();

    pipeline::Pipeline& pipeline() { return *pipeline_; }

private:
    void submit(pipeline::ops::Payload payload, Completion done);
    void dispatchEvent(const pipeline::EventPtr& event);

    std::shared_ptr<ports::IAuthenticationProvider> authProvider_;
    std::string deviceId_;
    std::unique_ptr<pipeline::Pipeline> pipeline_;

    std::mutex handlerMutex_;
    MethodRequestHandler methodHandler_;
    C2DMessageHandler c2dHandler_;
    TwinPatchHandler twinPatchHandler_;
    ConnectionStateHandler connectionHandler_;
};

} // namespace iotpipe
