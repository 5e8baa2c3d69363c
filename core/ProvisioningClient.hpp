/**
 * @file ProvisioningClient.hpp
 * @brief Device Provisioning Service registration on top of a provisioning pipeline
 *
 * Workflow:
 * 1. Hand the security client to the pipeline (symmetric key or X.509)
 * 2. Register, connecting on demand and polling until the service decides
 * 3. Disconnect from DPS and report the registration result
 *
 * @note Callbacks run on the pipeline's executor thread
 */

#pragma once

#include "IMqttClient.hpp"
#include "Models.hpp"
#include "pipeline/Error.hpp"
#include "pipeline/Pipeline.hpp"
#include "pipeline/PipelineOptions.hpp"
#include "ports/IExecutor.hpp"
#include "ports/ISecurityClient.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace iotpipe {

class ProvisioningClient {
public:
    using RegistrationCallback =
        std::function<void(const std::optional<pipeline::Error>& error, const RegistrationResult& result)>;

    /**
     * @param securityClient Symmetric-key or X.509 security client
     * @throws std::invalid_argument on a null collaborator or an unsupported security client type
     */
    ProvisioningClient(std::shared_ptr<ports::ISecurityClient> securityClient,
                       std::shared_ptr<IMqttClient> mqttClient,
                       std::shared_ptr<ports::IExecutor> executor,
                       const pipeline::PipelineOptions& options = pipeline::PipelineOptions{});

    ~ProvisioningClient();

    ProvisioningClient(const ProvisioningClient&) = delete;
    ProvisioningClient& operator=(const ProvisioningClient&) = delete;

    /**
     * @brief Register the device
     * @param callback Receives the result once the service assigned, failed or
     *        disabled the registration, or the first error
     * @param payload Custom allocation payload sent with the request
     */
    void registerDevice(RegistrationCallback callback, nlohmann::json payload = nullptr);

    void shutdown();

    pipeline::Pipeline& pipeline() { return *pipeline_; }

private:
    void submitRegistration(RegistrationCallback callback, nlohmann::json payload);
    void disconnectThenReport(RegistrationCallback callback, std::optional<pipeline::Error> error,
                              RegistrationResult result);

    std::shared_ptr<ports::ISecurityClient> securityClient_;
    std::unique_ptr<pipeline::Pipeline> pipeline_;
};

} // namespace iotpipe
