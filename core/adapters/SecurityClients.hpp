/**
 * @file SecurityClients.hpp
 * @brief Credential sources for DPS registration and IoT Hub connections
 */

#pragma once

#include "../IClock.hpp"
#include "../ports/IAuthenticationProvider.hpp"
#include "../ports/ISecurityClient.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace iotpipe::adapters {

/**
 * @brief Caches a SAS token and signs a new one shortly before expiry
 */
class SasTokenCache {
public:
    SasTokenCache(std::string resourceUri, std::string keyBase64, std::string keyName,
                  std::chrono::seconds ttl, std::shared_ptr<IClock> clock);

    std::string current();

    /// Force a new token on the next current() call
    void invalidate();

private:
    /// Tokens are renewed when less than this share of their lifetime remains
    static constexpr double kRenewalFraction = 0.1;

    std::string resourceUri_;
    std::string keyBase64_;
    std::string keyName_;
    std::chrono::seconds ttl_;
    std::shared_ptr<IClock> clock_;

    std::mutex mutex_;
    std::string token_;
    uint64_t expiry_ = 0;
};

/**
 * @brief DPS symmetric-key attestation (individual or group-derived key)
 *
 * Tokens are scoped to "{idScope}/registrations/{registrationId}" and signed
 * with key name "registration".
 */
class SymmetricKeySecurityClient : public ports::ISymmetricKeySecurityClient {
public:
    /// @throws std::invalid_argument on an empty field or a key that is not base64
    SymmetricKeySecurityClient(std::string provisioningHost,
                               std::string registrationId,
                               std::string idScope,
                               std::string symmetricKeyBase64,
                               std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
                               std::chrono::seconds ttl = std::chrono::hours(1));

    std::string provisioningHost() const override { return provisioningHost_; }
    std::string registrationId() const override { return registrationId_; }
    std::string idScope() const override { return idScope_; }
    std::string getCurrentSasToken() override;

private:
    std::string provisioningHost_;
    std::string registrationId_;
    std::string idScope_;
    SasTokenCache tokens_;
};

/**
 * @brief DPS X.509 attestation; the certificate is handed to TLS unchanged
 */
class X509SecurityClient : public ports::IX509SecurityClient {
public:
    /// @throws std::invalid_argument on an empty field
    X509SecurityClient(std::string provisioningHost,
                       std::string registrationId,
                       std::string idScope,
                       X509Certificate certificate);

    std::string provisioningHost() const override { return provisioningHost_; }
    std::string registrationId() const override { return registrationId_; }
    std::string idScope() const override { return idScope_; }
    X509Certificate getX509Certificate() const override { return certificate_; }

private:
    std::string provisioningHost_;
    std::string registrationId_;
    std::string idScope_;
    X509Certificate certificate_;
};

/**
 * @brief IoT Hub device or module identity with a shared access key
 */
class SymmetricKeyAuthenticationProvider : public ports::IAuthenticationProvider {
public:
    SymmetricKeyAuthenticationProvider(std::string hostname,
                                       std::string deviceId,
                                       std::string moduleId,
                                       std::string sharedAccessKeyBase64,
                                       std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
                                       std::chrono::seconds ttl = std::chrono::hours(1));

    /**
     * @brief Parse "HostName=...;DeviceId=...;[ModuleId=...;]SharedAccessKey=..."
     * @throws std::invalid_argument if HostName, DeviceId or SharedAccessKey is missing
     */
    static std::shared_ptr<SymmetricKeyAuthenticationProvider> fromConnectionString(
        const std::string& connectionString,
        std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

    std::string hostname() const override { return hostname_; }
    std::string deviceId() const override { return deviceId_; }
    std::string moduleId() const override { return moduleId_; }
    std::string getCurrentSasToken() override;

    /// Sign a fresh token regardless of the cached one's expiry
    std::string renewSasToken();

private:
    std::string hostname_;
    std::string deviceId_;
    std::string moduleId_;
    SasTokenCache tokens_;
};

} // namespace iotpipe::adapters
