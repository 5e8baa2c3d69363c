/**
 * @file ProvisioningStage.hpp
 * @brief Device Provisioning Service protocol over MQTT
 *
 * Registration workflow:
 * 1. Subscribe to $dps/registrations/res/# once per connection
 * 2. Publish the registration request with a fresh $rid
 * 3. While the service answers "assigning", poll the operation status after
 *    the retry-after interval
 * 4. Complete with the registration result once assigned, failed or disabled,
 *    or with a Timeout error when the provisioning deadline passes
 */

#pragma once

#include "../JsonCodec.hpp"
#include "../MqttTopics.hpp"
#include "../pipeline/RequestTracker.hpp"
#include "../pipeline/Stage.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace iotpipe::stages {

class ProvisioningStage : public pipeline::Stage {
public:
    struct Options {
        std::chrono::milliseconds timeout = std::chrono::seconds(120);
        std::chrono::milliseconds pollingInterval = std::chrono::seconds(2);  ///< Used when DPS sends no retry-after
    };

    ProvisioningStage() : ProvisioningStage(Options{}) {}
    explicit ProvisioningStage(Options options);

    std::size_t activeRegistrations() const { return active_.size(); }

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onEvent(const pipeline::EventPtr& event) override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    void setConnectionArgs(const pipeline::OperationPtr& op);
    void startRegistration(const pipeline::OperationPtr& op);
    void withSubscription(const pipeline::OperationPtr& op, std::function<void()> next);
    void sendRegister(const pipeline::OperationPtr& op);
    void sendQuery(const pipeline::OperationPtr& op, const std::string& operationId);
    void publishRequest(const pipeline::OperationPtr& op, const std::string& rid,
                        std::string topic, std::string payload);
    void handleResponse(const topics::DpsResponse& response, const std::string& body);
    void schedulePoll(const pipeline::OperationPtr& op, const std::string& operationId,
                      std::chrono::milliseconds delay);
    void onDeadline(std::uint64_t opId);
    void finish(const pipeline::OperationPtr& op, const std::optional<pipeline::Error>& error);
    void failAll(const pipeline::Error& error);

    Options options_;
    std::string registrationId_;
    bool subscribed_ = false;
    std::vector<std::function<void(const std::optional<pipeline::Error>&)>> subscriptionWaiters_;   ///< Ops held until the response subscription is acked
    pipeline::RequestTracker requests_;
    std::map<std::uint64_t, pipeline::OperationPtr> active_;    ///< Register and query ops by id
};

} // namespace iotpipe::stages
