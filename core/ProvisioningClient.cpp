#include "ProvisioningClient.hpp"
#include "pipeline/PipelineFactory.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace iotpipe {

using pipeline::Error;
using pipeline::Operation;
namespace ops = pipeline::ops;

namespace {

ops::Payload securityClientOp(const std::shared_ptr<ports::ISecurityClient>& securityClient) {
    if (auto symmetric = std::dynamic_pointer_cast<ports::ISymmetricKeySecurityClient>(securityClient)) {
        return ops::SetSymmetricKeySecurityClient{symmetric};
    }
    if (auto x509 = std::dynamic_pointer_cast<ports::IX509SecurityClient>(securityClient)) {
        return ops::SetX509SecurityClient{x509};
    }
    throw std::invalid_argument("ProvisioningClient: unsupported security client type");
}

} // namespace

ProvisioningClient::ProvisioningClient(std::shared_ptr<ports::ISecurityClient> securityClient,
                                       std::shared_ptr<IMqttClient> mqttClient,
                                       std::shared_ptr<ports::IExecutor> executor,
                                       const pipeline::PipelineOptions& options)
    : securityClient_(std::move(securityClient)) {
    if (!securityClient_) {
        throw std::invalid_argument("ProvisioningClient: security client cannot be null");
    }
    static_cast<void>(securityClientOp(securityClient_));
    pipeline_ = pipeline::createProvisioningPipeline(std::move(mqttClient), std::move(executor), options);
}

ProvisioningClient::~ProvisioningClient() {
    shutdown();
}

void ProvisioningClient::registerDevice(RegistrationCallback callback, nlohmann::json payload) {
    std::cout << "[DPS] Registering " << securityClient_->registrationId()
              << " with " << securityClient_->provisioningHost() << std::endl;

    pipeline_->submit(securityClientOp(securityClient_),
        [this, callback = std::move(callback), payload = std::move(payload)](
            Operation&, const std::optional<Error>& error) mutable {
            if (error) {
                std::cerr << "[DPS] Security client rejected: " << pipeline::toString(*error) << std::endl;
                if (callback) {
                    callback(error, RegistrationResult{});
                }
                return;
            }
            submitRegistration(std::move(callback), std::move(payload));
        });
}

void ProvisioningClient::submitRegistration(RegistrationCallback callback, nlohmann::json payload) {
    pipeline_->submit(ops::RegisterDevice{std::move(payload), RegistrationResult{}},
        [this, callback = std::move(callback)](Operation& op, const std::optional<Error>& error) mutable {
            RegistrationResult result = op.as<ops::RegisterDevice>().result;
            if (error) {
                std::cerr << "[DPS] Registration failed: " << pipeline::toString(*error) << std::endl;
            } else {
                std::cout << "[DPS] Registration " << result.status;
                if (result.isAssigned()) {
                    std::cout << ", device " << result.registrationState.deviceId
                              << " assigned to " << result.registrationState.assignedHub;
                }
                std::cout << std::endl;
            }
            disconnectThenReport(std::move(callback), error, std::move(result));
        });
}

void ProvisioningClient::disconnectThenReport(RegistrationCallback callback, std::optional<Error> error,
                                              RegistrationResult result) {
    pipeline_->submit(ops::Disconnect{},
        [callback = std::move(callback), error = std::move(error), result = std::move(result)](
            Operation&, const std::optional<Error>& disconnectError) {
            if (disconnectError && disconnectError->code != pipeline::ErrorCode::ShuttingDown) {
                std::cerr << "[DPS] Disconnect after registration failed: "
                          << pipeline::toString(*disconnectError) << std::endl;
            }
            if (callback) {
                callback(error, result);
            }
        });
}

void ProvisioningClient::shutdown() {
    if (pipeline_) {
        pipeline_->shutdown();
    }
}

} // namespace iotpipe
