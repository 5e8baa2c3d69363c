/**
 * @file IoTHubStage.hpp
 * @brief IoT Hub MQTT topics for telemetry, direct methods, C2D and twin
 *
 * Outbound operations are rewritten into publishes and subscriptions on the
 * hub's topic space. Inbound messages on those topics become typed events;
 * anything else continues upward as a raw MessageReceived.
 */

#pragma once

#include "../Models.hpp"
#include "../pipeline/RequestTracker.hpp"
#include "../pipeline/Stage.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace iotpipe::stages {

class IoTHubStage : public pipeline::Stage {
public:
    IoTHubStage() : Stage("IoTHubStage") {}

    bool isFeatureEnabled(Feature feature) const { return enabled_.count(feature) != 0; }

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onEvent(const pipeline::EventPtr& event) override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    using FeatureCallback = std::function<void(const std::optional<pipeline::Error>&)>;

    void setConnectionArgs(const pipeline::OperationPtr& op);
    bool requireIdentity(const pipeline::OperationPtr& op);
    void enableFeature(Feature feature, FeatureCallback done);
    std::vector<std::string> featureTopics(Feature feature) const;
    void sendTwinRequest(const pipeline::OperationPtr& op);

    void handleTwinResponse(const MqttMessage& message);
    void handleMethodRequest(const MqttMessage& message);
    void restoreFeatures();

    std::string deviceId_;
    std::string moduleId_;
    std::set<Feature> enabled_;
    std::set<Feature> wanted_;          ///< Re-subscribed after a reconnect
    std::map<Feature, std::vector<FeatureCallback>> enabling_;   ///< Subscriptions in flight
    pipeline::RequestTracker twinRequests_;
};

} // namespace iotpipe::stages
