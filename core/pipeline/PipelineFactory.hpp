#pragma once

#include "Pipeline.hpp"
#include "PipelineOptions.hpp"
#include "../IMqttClient.hpp"
#include <memory>

namespace iotpipe::pipeline {

/**
 * @brief Provisioning chain
 *
 * SecurityClientStage -> RetryStage -> ConnectionStage -> ProvisioningStage -> MqttTransportStage
 */
std::unique_ptr<Pipeline> createProvisioningPipeline(std::shared_ptr<IMqttClient> client,
                                                     std::shared_ptr<ports::IExecutor> executor,
                                                     const PipelineOptions& options = PipelineOptions{});

/**
 * @brief IoT Hub chain
 *
 * AuthProviderStage -> RetryStage -> BlobUploadStage -> ConnectionStage -> IoTHubStage -> MqttTransportStage
 */
std::unique_ptr<Pipeline> createIoTHubPipeline(std::shared_ptr<IMqttClient> client,
                                               std::shared_ptr<ports::IExecutor> executor,
                                               const PipelineOptions& options = PipelineOptions{});

} // namespace iotpipe::pipeline
