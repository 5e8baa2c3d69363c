#pragma once

#include "Models.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace iotpipe {

/**
 * @brief JSON bodies exchanged with DPS and IoT Hub
 *
 * Parse functions throw nlohmann::json::exception on malformed input.
 */
class JsonCodec {
public:
    static std::string registrationRequest(const std::string& registrationId, const nlohmann::json& payload);

    static RegistrationResult parseRegistrationResult(const std::string& json);
    static RegistrationResult jsonToRegistrationResult(const nlohmann::json& json);
    static RegistrationState jsonToRegistrationState(const nlohmann::json& json);
    static nlohmann::json registrationResultToJson(const RegistrationResult& result);

    /// Message of a DPS or hub error body, or the raw body if it has none
    static std::string errorMessage(const std::string& body);

    /// Empty body becomes null, non-JSON body becomes a JSON string
    static nlohmann::json parsePayload(const std::string& body);

    /// Null becomes an empty body
    static std::string serializePayload(const nlohmann::json& payload);
};

} // namespace iotpipe
