#include "Operation.hpp"

#include <utility>

namespace iotpipe::pipeline {

std::atomic<std::uint64_t> Operation::nextId_{1};

namespace {

void require(bool condition, const char* message) {
    if (!condition) {
        throw ValidationError(message);
    }
}

void requireIdentity(const ports::ISecurityClient& client) {
    require(!client.provisioningHost().empty(), "Security client has no provisioning host");
    require(!client.registrationId().empty(), "Security client has no registration id");
    require(!client.idScope().empty(), "Security client has no id scope");
}

void requireTopic(const std::string& topic, int qos) {
    require(!topic.empty(), "MQTT topic must not be empty");
    require(qos >= 0 && qos <= 2, "MQTT QoS must be 0, 1 or 2");
}

} // namespace

std::string operationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Connect:                       return "Connect";
        case OperationKind::Disconnect:                    return "Disconnect";
        case OperationKind::SetSymmetricKeySecurityClient: return "SetSymmetricKeySecurityClient";
        case OperationKind::SetX509SecurityClient:         return "SetX509SecurityClient";
        case OperationKind::SetAuthenticationProvider:     return "SetAuthenticationProvider";
        case OperationKind::RegisterDevice:                return "RegisterDevice";
        case OperationKind::QueryRegistrationStatus:       return "QueryRegistrationStatus";
        case OperationKind::SendTelemetry:                 return "SendTelemetry";
        case OperationKind::SendMethodResponse:            return "SendMethodResponse";
        case OperationKind::EnableFeature:                 return "EnableFeature";
        case OperationKind::GetTwin:                       return "GetTwin";
        case OperationKind::PatchTwinReportedProperties:   return "PatchTwinReportedProperties";
        case OperationKind::UploadBlob:                    return "UploadBlob";
        case OperationKind::SetConnectionArgs:             return "SetConnectionArgs";
        case OperationKind::SetMqttConnectionArgs:         return "SetMqttConnectionArgs";
        case OperationKind::SetCredentialToken:            return "SetCredentialToken";
        case OperationKind::SetClientCertificate:          return "SetClientCertificate";
        case OperationKind::MqttPublish:                   return "MqttPublish";
        case OperationKind::MqttSubscribe:                 return "MqttSubscribe";
        case OperationKind::MqttUnsubscribe:               return "MqttUnsubscribe";
    }
    return "Unknown";
}

OperationPtr Operation::create(ops::Payload payload, OperationCallback callback) {
    validate(payload);
    return OperationPtr(new Operation(std::move(payload), std::move(callback)));
}

Operation::Operation(ops::Payload payload, OperationCallback callback)
    : id_(nextId_.fetch_add(1)),
      payload_(std::move(payload)),
      callback_(std::move(callback)) {
}

void Operation::validate(const ops::Payload& payload) {
    std::visit(Overloaded{
        [](const ops::SetSymmetricKeySecurityClient& p) {
            require(p.securityClient != nullptr, "SetSymmetricKeySecurityClient requires a security client");
            requireIdentity(*p.securityClient);
        },
        [](const ops::SetX509SecurityClient& p) {
            require(p.securityClient != nullptr, "SetX509SecurityClient requires a security client");
            requireIdentity(*p.securityClient);
        },
        [](const ops::SetAuthenticationProvider& p) {
            require(p.authProvider != nullptr, "SetAuthenticationProvider requires an authentication provider");
            require(!p.authProvider->hostname().empty(), "Authentication provider has no hostname");
            require(!p.authProvider->deviceId().empty(), "Authentication provider has no device id");
        },
        [](const ops::QueryRegistrationStatus& p) {
            require(!p.operationId.empty(), "QueryRegistrationStatus requires an operation id");
        },
        [](const ops::SendMethodResponse& p) {
            require(!p.response.requestId.empty(), "SendMethodResponse requires a request id");
        },
        [](const ops::PatchTwinReportedProperties& p) {
            require(p.patch.is_object(), "Reported properties patch must be a JSON object");
        },
        [](const ops::UploadBlob& p) {
            require(!p.blobName.empty(), "UploadBlob requires a blob name");
        },
        [](const ops::SetConnectionArgs& p) {
            require(!p.host.empty(), "SetConnectionArgs requires a host");
            require(!p.registrationId.empty() || !p.deviceId.empty(),
                    "SetConnectionArgs requires a registration id or a device id");
            require(!(p.sasToken && p.clientCertificate),
                    "SetConnectionArgs carries either a token or a certificate, not both");
        },
        [](const ops::SetMqttConnectionArgs& p) {
            require(!p.host.empty(), "SetMqttConnectionArgs requires a host");
            require(!p.clientId.empty(), "SetMqttConnectionArgs requires a client id");
            require(!p.username.empty(), "SetMqttConnectionArgs requires a username");
        },
        [](const ops::SetCredentialToken& p) {
            require(!p.token.empty(), "SetCredentialToken requires a token");
        },
        [](const ops::SetClientCertificate& p) {
            require(!p.certificate.empty(), "SetClientCertificate requires certificate and key paths");
        },
        [](const ops::MqttPublish& p) { requireTopic(p.topic, p.qos); },
        [](const ops::MqttSubscribe& p) { requireTopic(p.topic, p.qos); },
        [](const ops::MqttUnsubscribe& p) { requireTopic(p.topic, 0); },
        [](const auto&) {}
    }, payload);
}

OperationKind Operation::kind() const {
    return static_cast<OperationKind>(payload_.index());
}

std::string Operation::name() const {
    return operationKindToString(kind()) + "#" + std::to_string(id_);
}

void Operation::setCallback(OperationCallback callback) {
    if (callback_) {
        throw PipelineConfigurationError(name() + " already has a completion callback");
    }
    callback_ = std::move(callback);
}

OperationCallback Operation::takeCallback() {
    auto callback = std::move(callback_);
    callback_ = nullptr;
    return callback;
}

void Operation::complete(std::optional<Error> error) {
    if (completed_.exchange(true)) {
        throw OperationAlreadyCompletedError(name() + " completed twice");
    }
    finish(std::move(error));
}

bool Operation::completeIfPending(const Error& error) {
    if (completed_.exchange(true)) {
        return false;
    }
    finish(error);
    return true;
}

void Operation::finish(std::optional<Error> error) {
    error_ = std::move(error);
    auto callback = std::move(callback_);
    callback_ = nullptr;
    if (callback) {
        callback(*this, error_);
    }
}

} // namespace iotpipe::pipeline
