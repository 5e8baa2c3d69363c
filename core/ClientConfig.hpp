#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace iotpipe {

struct ProvisioningSettings {
    std::string globalEndpoint = "global.azure-devices-provisioning.net";
    std::string idScope;
    std::string registrationId;
    std::string symmetricKey;               ///< Base64; empty selects X.509 attestation
    std::string certPath;
    std::string keyPath;
    std::string keyPassword;
    std::chrono::seconds timeout{120};

    bool enabled() const { return !idScope.empty(); }
    bool usesSymmetricKey() const { return !symmetricKey.empty(); }
};

struct HubSettings {
    std::string connectionString;           ///< HostName=...;DeviceId=...;SharedAccessKey=...
};

struct TransportSettings {
    std::uint16_t port = 8883;
    std::string caPath;
    bool verifyServerCert = true;
    int keepAliveSeconds = 240;
};

struct RetrySettings {
    std::chrono::milliseconds baseDelay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay = std::chrono::minutes(5);
    int maxAttempts = 5;                    ///< 1 disables retries
};

struct TelemetrySettings {
    int intervalSeconds = 10;
    int count = 0;                          ///< 0 sends until interrupted
};

/**
 * @brief Everything the CLI needs to provision and connect a device
 *
 * Either provisioning.idScope or hub.connectionString must be set. When both
 * are present the device is provisioned first.
 */
struct ClientConfig {
    ProvisioningSettings provisioning;
    HubSettings hub;
    TransportSettings transport;
    RetrySettings retry;
    TelemetrySettings telemetry;
};

} // namespace iotpipe
