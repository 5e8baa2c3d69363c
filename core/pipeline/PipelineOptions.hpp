#pragma once

#include "../IMqttClient.hpp"
#include "../ports/IBlobUploader.hpp"
#include "../ports/IRetryPolicy.hpp"
#include <chrono>
#include <cstdint>
#include <memory>

namespace iotpipe::pipeline {

/**
 * @brief Settings shared by the pipeline factories
 *
 * A null retryPolicy selects the default exponential backoff.
 */
struct PipelineOptions {
    std::uint16_t port = 8883;
    TlsConfig tls;                                              ///< caPath and verifyServer only
    std::shared_ptr<ports::RetryPolicy> retryPolicy;
    std::chrono::milliseconds provisioningTimeout = std::chrono::seconds(120);
    std::chrono::milliseconds pollingInterval = std::chrono::seconds(2);
    std::shared_ptr<ports::IBlobUploader> blobUploader;         ///< Hub pipelines only, may be null
};

} // namespace iotpipe::pipeline
