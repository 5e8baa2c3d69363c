#include "IoTHubStage.hpp"
#include "../JsonCodec.hpp"
#include "../MqttTopics.hpp"
#include "../pipeline/OperationFlow.hpp"

#include <iostream>
#include <utility>

namespace iotpipe::stages {

using namespace pipeline;

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void IoTHubStage::runOp(const OperationPtr& op) {
    std::visit(Overloaded{
        [&](const ops::SetConnectionArgs&) { setConnectionArgs(op); },
        [&](const ops::SendTelemetry& p) {
            if (!requireIdentity(op)) {
                return;
            }
            auto publish = Operation::create(ops::MqttPublish{
                topics::telemetryTopic(deviceId_, moduleId_, p.message), p.message.payload, 1});
            delegateToDifferentOp(*this, op, publish);
        },
        [&](const ops::SendMethodResponse& p) {
            auto publish = Operation::create(ops::MqttPublish{
                topics::methodResponseTopic(p.response.status, p.response.requestId),
                JsonCodec::serializePayload(p.response.payload), 1});
            delegateToDifferentOp(*this, op, publish);
        },
        [&](const ops::EnableFeature& p) {
            if (!requireIdentity(op)) {
                return;
            }
            enableFeature(p.feature, [op](const std::optional<Error>& error) {
                if (!sweptAtTeardown(op)) {
                    op->complete(error);
                }
            });
        },
        [&](const ops::GetTwin&) { sendTwinRequest(op); },
        [&](const ops::PatchTwinReportedProperties&) { sendTwinRequest(op); },
        [&](const auto&) { passOpToNextStage(op); }
    }, op->payload());
}

void IoTHubStage::setConnectionArgs(const OperationPtr& op) {
    const auto& args = op->as<ops::SetConnectionArgs>();

    deviceId_ = args.deviceId.empty() ? args.registrationId : args.deviceId;
    moduleId_ = args.moduleId;
    enabled_.clear();

    ops::SetMqttConnectionArgs mqtt;
    mqtt.host = args.host;
    mqtt.clientId = topics::hubClientId(deviceId_, moduleId_);
    mqtt.username = topics::hubUsername(args.host, mqtt.clientId);
    mqtt.sasToken = args.sasToken;
    mqtt.clientCertificate = args.clientCertificate;

    std::cout << "[IoTHub] Identity " << mqtt.clientId << " on " << args.host << std::endl;
    delegateToDifferentOp(*this, op, Operation::create(std::move(mqtt)));
}

bool IoTHubStage::requireIdentity(const OperationPtr& op) {
    if (!deviceId_.empty()) {
        return true;
    }
    op->complete(Error::configuration(op->name() + " requires connection arguments, set an authentication provider first"));
    return false;
}

std::vector<std::string> IoTHubStage::featureTopics(Feature feature) const {
    switch (feature) {
        case Feature::Methods:
            return {topics::kMethodsSubscription};
        case Feature::C2D:
            return {topics::c2dSubscription(deviceId_)};
        case Feature::Twin:
            return {topics::kTwinResponseSubscription, topics::kTwinPatchSubscription};
    }
    return {};
}

void IoTHubStage::enableFeature(Feature feature, FeatureCallback done) {
    wanted_.insert(feature);
    if (enabled_.count(feature) != 0) {
        done(std::nullopt);
        return;
    }
    auto inFlight = enabling_.find(feature);
    if (inFlight != enabling_.end()) {
        inFlight->second.push_back(std::move(done));
        return;
    }
    enabling_[feature].push_back(std::move(done));

    std::vector<OperationPtr> steps;
    for (const auto& topic : featureTopics(feature)) {
        steps.push_back(Operation::create(ops::MqttSubscribe{topic, 1}));
    }

    // Internal op that records the feature before handing the outcome on
    auto tracker = Operation::create(ops::EnableFeature{feature},
        [this, feature](Operation&, const std::optional<Error>& error) {
            if (!error) {
                enabled_.insert(feature);
                std::cout << "[IoTHub] Enabled " << featureToString(feature) << std::endl;
            } else {
                std::cerr << "[IoTHub] Enabling " << featureToString(feature) << " failed: "
                          << toString(*error) << std::endl;
            }
            auto waiters = std::move(enabling_[feature]);
            enabling_.erase(feature);
            for (auto& waiter : waiters) {
                waiter(error);
            }
        });
    delegateSequence(*this, tracker, std::move(steps));
}

void IoTHubStage::sendTwinRequest(const OperationPtr& op) {
    if (!requireIdentity(op)) {
        return;
    }

    enableFeature(Feature::Twin, [this, op](const std::optional<Error>& error) {
        if (sweptAtTeardown(op)) {
            return;
        }
        if (error) {
            op->complete(error);
            return;
        }

        const std::string rid = twinRequests_.track(op);
        ops::MqttPublish publish;
        publish.qos = 1;
        if (op->is<ops::GetTwin>()) {
            publish.topic = topics::twinGetTopic(rid);
        } else {
            publish.topic = topics::twinReportedTopic(rid);
            publish.payload = op->as<ops::PatchTwinReportedProperties>().patch.dump();
        }

        auto sub = Operation::create(std::move(publish), [this, rid](Operation&, const std::optional<Error>& error) {
            if (!error) {
                return;
            }
            if (auto pending = twinRequests_.take(rid)) {
                pending->complete(error);
            }
        });
        passOpToNextStage(sub);
    });
}

void IoTHubStage::onEvent(const EventPtr& event) {
    if (event->is<events::MessageReceived>()) {
        const auto& message = event->as<events::MessageReceived>().message;

        if (startsWith(message.topic, topics::kTwinResponsePrefix)) {
            handleTwinResponse(message);
            return;
        }
        if (startsWith(message.topic, topics::kMethodsPrefix)) {
            handleMethodRequest(message);
            return;
        }
        if (startsWith(message.topic, topics::kTwinPatchPrefix)) {
            sendEventUp(makeEvent(events::TwinPatchReceived{
                JsonCodec::parsePayload(message.payload), topics::parseTwinPatchVersion(message.topic)}));
            return;
        }
        if (!deviceId_.empty() && startsWith(message.topic, topics::c2dPrefix(deviceId_))) {
            sendEventUp(makeEvent(events::C2DMessageReceived{
                topics::parseC2DTopic(message.topic, deviceId_, message.payload)}));
            return;
        }
    } else if (event->is<events::ConnectionStateChanged>()) {
        const auto& change = event->as<events::ConnectionStateChanged>();
        if (change.connected) {
            restoreFeatures();
        } else {
            // Clean sessions drop subscriptions with the connection
            enabled_.clear();
            for (const auto& op : twinRequests_.takeAll()) {
                op->complete(Error::transport("Connection lost while waiting for twin response", true));
            }
        }
    }
    sendEventUp(event);
}

void IoTHubStage::handleTwinResponse(const MqttMessage& message) {
    auto response = topics::parseTwinResponseTopic(message.topic);
    if (!response) {
        std::cerr << "[IoTHub] Unrecognised twin response topic: " << message.topic << std::endl;
        return;
    }

    OperationPtr op = twinRequests_.take(response->rid);
    if (!op) {
        std::cout << "[IoTHub] Ignoring twin response for unknown $rid=" << response->rid << std::endl;
        return;
    }

    if (response->status >= 300) {
        const bool retryable = response->status == 429 || response->status >= 500;
        op->complete(Error::service("Twin request failed with status " + std::to_string(response->status) +
                                    ": " + JsonCodec::errorMessage(message.payload), retryable));
        return;
    }

    if (op->is<ops::GetTwin>()) {
        auto twin = JsonCodec::parsePayload(message.payload);
        if (!twin.is_object()) {
            op->complete(Error::service("Twin response is not a JSON object"));
            return;
        }
        op->as<ops::GetTwin>().twin = std::move(twin);
    } else {
        op->as<ops::PatchTwinReportedProperties>().version = response->version;
    }
    op->complete();
}

void IoTHubStage::handleMethodRequest(const MqttMessage& message) {
    auto request = topics::parseMethodRequestTopic(message.topic);
    if (!request) {
        std::cerr << "[IoTHub] Unrecognised method topic: " << message.topic << std::endl;
        return;
    }

    MethodRequest method;
    method.requestId = request->rid;
    method.name = request->name;
    method.payload = JsonCodec::parsePayload(message.payload);

    std::cout << "[IoTHub] Method request '" << method.name << "' ($rid=" << method.requestId << ")" << std::endl;
    sendEventUp(makeEvent(events::MethodRequestReceived{std::move(method)}));
}

void IoTHubStage::restoreFeatures() {
    for (Feature feature : wanted_) {
        if (enabled_.count(feature) != 0 || enabling_.count(feature) != 0) {
            continue;
        }
        std::cout << "[IoTHub] Restoring " << featureToString(feature) << " subscription" << std::endl;
        enableFeature(feature, [](const std::optional<Error>&) {});
    }
}

void IoTHubStage::onShutdown(const Error& reason) {
    for (const auto& op : twinRequests_.takeAll()) {
        op->complete(reason);
    }
}

} // namespace iotpipe::stages
