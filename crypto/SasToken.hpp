#pragma once

#include <string>
#include <cstdint>

namespace iotpipe {

/**
 * @brief Shared Access Signature tokens for DPS and IoT Hub
 *
 * Token format: "SharedAccessSignature sr={uri}&sig={sig}&se={expiry}[&skn={keyName}]"
 */
class SasToken {
public:
    struct Config {
        std::string resourceUri;
        std::string keyBase64;
        std::string keyName;                ///< "registration" for DPS, empty for device keys
        uint64_t expirySeconds = 3600;
    };

    /// @throws std::invalid_argument on an empty resource URI or undecodable key
    static std::string generate(const Config& config);
    static std::string generate(const std::string& resourceUri,
                                const std::string& keyBase64,
                                const std::string& keyName,
                                uint64_t expiryEpochSeconds);

    /// "{host}/devices/{deviceId}[/modules/{moduleId}]" with the host lowercased
    static std::string deviceResourceUri(const std::string& host,
                                         const std::string& deviceId,
                                         const std::string& moduleId = "");

    /// "{idScope}/registrations/{registrationId}"
    static std::string registrationResourceUri(const std::string& idScope, const std::string& registrationId);

    static std::string urlEncode(const std::string& value);
    static std::string base64Decode(const std::string& encoded);
    static std::string base64Encode(const std::string& data);

private:
    static std::string hmacSha256(const std::string& key, const std::string& message);
    static std::string createStringToSign(const std::string& resourceUri, uint64_t expiry);
};

} // namespace iotpipe
