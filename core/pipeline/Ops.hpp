/**
 * @file Ops.hpp
 * @brief Payloads of every operation kind the pipeline understands
 *
 * The set is closed: a new kind is a new alternative in ops::Payload and a
 * matching OperationKind enumerator, in the same position.
 */

#pragma once

#include "../Models.hpp"
#include "../ports/IAuthenticationProvider.hpp"
#include "../ports/ISecurityClient.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace iotpipe::pipeline {

/// Visitor built from a set of lambdas
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

namespace ops {

// High level, submitted by client code

struct Connect {};

struct Disconnect {};

struct SetSymmetricKeySecurityClient {
    std::shared_ptr<ports::ISymmetricKeySecurityClient> securityClient;
};

struct SetX509SecurityClient {
    std::shared_ptr<ports::IX509SecurityClient> securityClient;
};

struct SetAuthenticationProvider {
    std::shared_ptr<ports::IAuthenticationProvider> authProvider;
};

struct RegisterDevice {
    nlohmann::json payload;             ///< Custom allocation payload, null if unused
    RegistrationResult result;          ///< Filled in on success
};

struct QueryRegistrationStatus {
    std::string operationId;
    RegistrationResult result;          ///< Filled in on success
};

struct SendTelemetry {
    Message message;
};

struct SendMethodResponse {
    MethodResponse response;
};

struct EnableFeature {
    Feature feature = Feature::Methods;
};

struct GetTwin {
    nlohmann::json twin;                ///< Filled in on success
};

struct PatchTwinReportedProperties {
    nlohmann::json patch;
    int version = 0;                    ///< Reported version returned by the hub
};

struct UploadBlob {
    std::string blobName;
    std::string content;
};

// Low level, transport vocabulary

/**
 * @brief Identity and credential of the endpoint the transport will reach
 *
 * Provisioning fills registrationId and idScope, IoT Hub fills deviceId and
 * optionally moduleId. At most one of sasToken and clientCertificate is set.
 */
struct SetConnectionArgs {
    std::string host;
    std::string registrationId;
    std::string idScope;
    std::string deviceId;
    std::string moduleId;
    std::optional<std::string> sasToken;
    std::optional<X509Certificate> clientCertificate;
};

struct SetMqttConnectionArgs {
    std::string host;
    std::string clientId;
    std::string username;
    std::optional<std::string> sasToken;
    std::optional<X509Certificate> clientCertificate;
};

struct SetCredentialToken {
    std::string token;
};

struct SetClientCertificate {
    X509Certificate certificate;
};

struct MqttPublish {
    std::string topic;
    std::string payload;
    int qos = 1;
};

struct MqttSubscribe {
    std::string topic;
    int qos = 1;
};

struct MqttUnsubscribe {
    std::string topic;
};

using Payload = std::variant<
    Connect,
    Disconnect,
    SetSymmetricKeySecurityClient,
    SetX509SecurityClient,
    SetAuthenticationProvider,
    RegisterDevice,
    QueryRegistrationStatus,
    SendTelemetry,
    SendMethodResponse,
    EnableFeature,
    GetTwin,
    PatchTwinReportedProperties,
    UploadBlob,
    SetConnectionArgs,
    SetMqttConnectionArgs,
    SetCredentialToken,
    SetClientCertificate,
    MqttPublish,
    MqttSubscribe,
    MqttUnsubscribe>;

} // namespace ops

enum class OperationKind {
    Connect,
    Disconnect,
    SetSymmetricKeySecurityClient,
    SetX509SecurityClient,
    SetAuthenticationProvider,
    RegisterDevice,
    QueryRegistrationStatus,
    SendTelemetry,
    SendMethodResponse,
    EnableFeature,
    GetTwin,
    PatchTwinReportedProperties,
    UploadBlob,
    SetConnectionArgs,
    SetMqttConnectionArgs,
    SetCredentialToken,
    SetClientCertificate,
    MqttPublish,
    MqttSubscribe,
    MqttUnsubscribe
};

constexpr std::size_t kOperationKindCount = static_cast<std::size_t>(OperationKind::MqttUnsubscribe) + 1;
static_assert(std::variant_size_v<ops::Payload> == kOperationKindCount,
              "OperationKind must list every ops::Payload alternative");

std::string operationKindToString(OperationKind kind);

} // namespace iotpipe::pipeline
