/**
 * @file MqttTopics.hpp
 * @brief Topic and username formats of the Azure DPS and IoT Hub MQTT APIs
 */

#pragma once

#include "Models.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace iotpipe::topics {

// Device Provisioning Service

constexpr const char* kDpsApiVersion = "2019-03-31";
constexpr const char* kDpsResponseSubscription = "$dps/registrations/res/#";
constexpr const char* kDpsResponsePrefix = "$dps/registrations/res/";

std::string dpsUsername(const std::string& idScope, const std::string& registrationId);
std::string dpsRegisterTopic(const std::string& rid);
std::string dpsQueryTopic(const std::string& rid, const std::string& operationId);

struct DpsResponse {
    int status = 0;
    std::string rid;
    std::optional<std::chrono::seconds> retryAfter;
};

/// Parse "$dps/registrations/res/{status}/?$rid={rid}&retry-after={s}"
std::optional<DpsResponse> parseDpsResponseTopic(const std::string& topic);

// IoT Hub

constexpr const char* kHubApiVersion = "2021-04-12";
constexpr const char* kMethodsSubscription = "$iothub/methods/POST/#";
constexpr const char* kMethodsPrefix = "$iothub/methods/POST/";
constexpr const char* kTwinResponseSubscription = "$iothub/twin/res/#";
constexpr const char* kTwinResponsePrefix = "$iothub/twin/res/";
constexpr const char* kTwinPatchSubscription = "$iothub/twin/PATCH/properties/desired/#";
constexpr const char* kTwinPatchPrefix = "$iothub/twin/PATCH/properties/desired/";

/// "deviceId" for devices, "deviceId/moduleId" for modules
std::string hubClientId(const std::string& deviceId, const std::string& moduleId);
std::string hubUsername(const std::string& host, const std::string& clientId);

/// Telemetry topic with system and custom properties appended
std::string telemetryTopic(const std::string& deviceId, const std::string& moduleId, const Message& message);

std::string c2dSubscription(const std::string& deviceId);
std::string c2dPrefix(const std::string& deviceId);
std::string methodResponseTopic(int status, const std::string& rid);
std::string twinGetTopic(const std::string& rid);
std::string twinReportedTopic(const std::string& rid);

struct MethodRequestTopic {
    std::string name;
    std::string rid;
};

/// Parse "$iothub/methods/POST/{name}/?$rid={rid}"
std::optional<MethodRequestTopic> parseMethodRequestTopic(const std::string& topic);

struct TwinResponseTopic {
    int status = 0;
    std::string rid;
    int version = 0;
};

/// Parse "$iothub/twin/res/{status}/?$rid={rid}[&$version={v}]"
std::optional<TwinResponseTopic> parseTwinResponseTopic(const std::string& topic);

/// Version of "$iothub/twin/PATCH/properties/desired/?$version={v}", 0 if absent
int parseTwinPatchVersion(const std::string& topic);

/// Decode the property bag of a cloud-to-device topic into message fields
Message parseC2DTopic(const std::string& topic, const std::string& deviceId, const std::string& payload);

/// Split "a=1&b=2" into decoded key/value pairs
std::map<std::string, std::string> parseQuery(const std::string& query);

std::string urlDecode(const std::string& value);

} // namespace iotpipe::topics
