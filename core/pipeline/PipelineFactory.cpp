#include "PipelineFactory.hpp"
#include "../adapters/DefaultPolicies.hpp"
#include "../stages/AuthProviderStage.hpp"
#include "../stages/BlobUploadStage.hpp"
#include "../stages/ConnectionStage.hpp"
#include "../stages/IoTHubStage.hpp"
#include "../stages/MqttTransportStage.hpp"
#include "../stages/ProvisioningStage.hpp"
#include "../stages/RetryStage.hpp"
#include "../stages/SecurityClientStage.hpp"

#include <utility>
#include <vector>

namespace iotpipe::pipeline {

namespace {

std::shared_ptr<ports::RetryPolicy> retryPolicyFor(const PipelineOptions& options) {
    if (options.retryPolicy) {
        return options.retryPolicy;
    }
    return std::make_shared<adapters::ExponentialBackoffRetryPolicy>();
}

std::unique_ptr<stages::MqttTransportStage> transportFor(std::shared_ptr<IMqttClient> client,
                                                         const PipelineOptions& options) {
    stages::MqttTransportStage::Options transport;
    transport.port = options.port;
    transport.tls = options.tls;
    return std::make_unique<stages::MqttTransportStage>(std::move(client), transport);
}

} // namespace

std::unique_ptr<Pipeline> createProvisioningPipeline(std::shared_ptr<IMqttClient> client,
                                                     std::shared_ptr<ports::IExecutor> executor,
                                                     const PipelineOptions& options) {
    stages::ProvisioningStage::Options provisioning;
    provisioning.timeout = options.provisioningTimeout;
    provisioning.pollingInterval = options.pollingInterval;

    std::vector<std::unique_ptr<Stage>> chain;
    chain.push_back(std::make_unique<stages::SecurityClientStage>());
    chain.push_back(std::make_unique<stages::RetryStage>(retryPolicyFor(options)));
    chain.push_back(std::make_unique<stages::ConnectionStage>());
    chain.push_back(std::make_unique<stages::ProvisioningStage>(provisioning));
    chain.push_back(transportFor(std::move(client), options));

    return std::make_unique<Pipeline>(std::move(executor), std::move(chain));
}

std::unique_ptr<Pipeline> createIoTHubPipeline(std::shared_ptr<IMqttClient> client,
                                               std::shared_ptr<ports::IExecutor> executor,
                                               const PipelineOptions& options) {
    std::vector<std::unique_ptr<Stage>> chain;
    chain.push_back(std::make_unique<stages::AuthProviderStage>());
    chain.push_back(std::make_unique<stages::RetryStage>(retryPolicyFor(options)));
    chain.push_back(std::make_unique<stages::BlobUploadStage>(options.blobUploader));
    chain.push_back(std::make_unique<stages::ConnectionStage>());
    chain.push_back(std::make_unique<stages::IoTHubStage>());
    chain.push_back(transportFor(std::move(client), options));

    return std::make_unique<Pipeline>(std::move(executor), std::move(chain));
}

} // namespace iotpipe::pipeline
