/**
 * @file Models.hpp
 * @brief Payload types exchanged with IoT Hub and the Device Provisioning Service
 */

#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace iotpipe {

/**
 * @brief X.509 client credential, carried opaquely to the transport
 *
 * @note Paths point to PEM files; the pipeline never reads them
 */
struct X509Certificate {
    std::string certPath;          ///< Client certificate or chain (.pem)
    std::string keyPath;           ///< Private key (.pem)
    std::string passPhrase;        ///< Private key pass phrase, empty if none

    bool empty() const { return certPath.empty() || keyPath.empty(); }
};

/**
 * @brief Device-to-cloud or cloud-to-device message
 */
struct Message {
    std::string payload;
    std::string messageId;                          ///< Sent as $.mid
    std::string correlationId;                      ///< Sent as $.cid
    std::string contentType = "application/json";   ///< Sent as $.ct
    std::string contentEncoding = "utf-8";          ///< Sent as $.ce
    std::string componentName;                      ///< Plug and play component, sent as $.sub
    std::map<std::string, std::string> customProperties;
};

struct MethodRequest {
    std::string requestId;
    std::string name;
    nlohmann::json payload;
};

struct MethodResponse {
    std::string requestId;
    int status = 200;
    nlohmann::json payload;
};

/// Cloud-to-device capabilities that need topic subscriptions
enum class Feature {
    Methods,
    C2D,
    Twin
};

std::string featureToString(Feature feature);

/**
 * @brief Registration state returned by DPS once a device is assigned
 */
struct RegistrationState {
    std::string registrationId;
    std::string assignedHub;
    std::string deviceId;
    std::string status;
    std::string substatus;
    std::string etag;
    std::string createdDateTimeUtc;
    std::string lastUpdatedDateTimeUtc;
    int errorCode = 0;
    std::string errorMessage;
    nlohmann::json payload;                         ///< Custom allocation payload, null if absent
};

/**
 * @brief DPS registration operation status
 */
struct RegistrationResult {
    std::string operationId;
    std::string status;                             ///< assigning, assigned, failed or disabled
    RegistrationState registrationState;

    bool isAssigned() const { return status == "assigned"; }
};

} // namespace iotpipe
