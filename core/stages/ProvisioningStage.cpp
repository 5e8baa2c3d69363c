#include "ProvisioningStage.hpp"
#include "../pipeline/OperationFlow.hpp"
#include "../pipeline/PipelineContext.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace iotpipe::stages {

using namespace pipeline;

ProvisioningStage::ProvisioningStage(Options options)
    : Stage("ProvisioningStage"), options_(options) {
}

void ProvisioningStage::runOp(const OperationPtr& op) {
    switch (op->kind()) {
        case OperationKind::SetConnectionArgs:
            setConnectionArgs(op);
            break;
        case OperationKind::RegisterDevice:
        case OperationKind::QueryRegistrationStatus:
            startRegistration(op);
            break;
        default:
            passOpToNextStage(op);
            break;
    }
}

void ProvisioningStage::setConnectionArgs(const OperationPtr& op) {
    const auto& args = op->as<ops::SetConnectionArgs>();
    if (args.registrationId.empty() || args.idScope.empty()) {
        op->complete(Error::validation("Provisioning connection requires a registration id and an id scope"));
        return;
    }

    registrationId_ = args.registrationId;

    ops::SetMqttConnectionArgs mqtt;
    mqtt.host = args.host;
    mqtt.clientId = args.registrationId;
    mqtt.username = topics::dpsUsername(args.idScope, args.registrationId);
    mqtt.sasToken = args.sasToken;
    mqtt.clientCertificate = args.clientCertificate;

    std::cout << "[DPS] Registration " << registrationId_ << " in scope " << args.idScope
              << " via " << args.host << std::endl;
    delegateToDifferentOp(*this, op, Operation::create(std::move(mqtt)));
}

void ProvisioningStage::startRegistration(const OperationPtr& op) {
    if (registrationId_.empty()) {
        op->complete(Error::configuration(op->name() + " requires connection arguments, set a security client first"));
        return;
    }

    const std::uint64_t opId = op->id();
    active_.emplace(opId, op);
    if (!context().executor().postDelayed(options_.timeout, [this, opId] { onDeadline(opId); })) {
        finish(op, Error::shuttingDown());
        return;
    }

    withSubscription(op, [this, op] {
        if (op->is<ops::RegisterDevice>()) {
            sendRegister(op);
        } else {
            sendQuery(op, op->as<ops::QueryRegistrationStatus>().operationId);
        }
    });
}

void ProvisioningStage::withSubscription(const OperationPtr& op, std::function<void()> next) {
    if (subscribed_) {
        next();
        return;
    }

    const bool inFlight = !subscriptionWaiters_.empty();
    subscriptionWaiters_.push_back([this, op, next](const std::optional<Error>& error) {
        if (active_.count(op->id()) == 0) {
            return;
        }
        if (error) {
            finish(op, error);
            return;
        }
        next();
    });
    if (inFlight) {
        return;
    }

    auto subscribe = Operation::create(ops::MqttSubscribe{topics::kDpsResponseSubscription, 1},
        [this](Operation&, const std::optional<Error>& error) {
            if (!error) {
                subscribed_ = true;
            }
            auto waiters = std::move(subscriptionWaiters_);
            subscriptionWaiters_.clear();
            for (auto& waiter : waiters) {
                waiter(error);
            }
        });
    passOpToNextStage(subscribe);
}

void ProvisioningStage::sendRegister(const OperationPtr& op) {
    const std::string rid = requests_.track(op);
    const auto& payload = op->as<ops::RegisterDevice>().payload;

    std::cout << "[DPS] Sending registration request for " << registrationId_ << " ($rid=" << rid << ")" << std::endl;
    publishRequest(op, rid, topics::dpsRegisterTopic(rid), JsonCodec::registrationRequest(registrationId_, payload));
}

void ProvisioningStage::sendQuery(const OperationPtr& op, const std::string& operationId) {
    const std::string rid = requests_.track(op);
    publishRequest(op, rid, topics::dpsQueryTopic(rid, operationId), std::string());
}

void ProvisioningStage::publishRequest(const OperationPtr& op, const std::string& rid,
                                       std::string topic, std::string payload) {
    auto publish = Operation::create(ops::MqttPublish{std::move(topic), std::move(payload), 1},
        [this, op, rid](Operation&, const std::optional<Error>& error) {
            if (!error) {
                return;
            }
            if (requests_.take(rid)) {
                finish(op, error);
            }
        });
    passOpToNextStage(publish);
}

void ProvisioningStage::onEvent(const EventPtr& event) {
    if (event->is<events::MessageReceived>()) {
        const auto& message = event->as<events::MessageReceived>().message;
        if (message.topic.compare(0, std::string(topics::kDpsResponsePrefix).size(), topics::kDpsResponsePrefix) == 0) {
            auto response = topics::parseDpsResponseTopic(message.topic);
            if (!response) {
                std::cerr << "[DPS] Unrecognised response topic: " << message.topic << std::endl;
                return;
            }
            handleResponse(*response, message.payload);
            return;
        }
    } else if (event->is<events::ConnectionStateChanged>()) {
        const auto& change = event->as<events::ConnectionStateChanged>();
        if (!change.connected) {
            subscribed_ = false;
            if (!active_.empty()) {
                failAll(Error::transport("Connection to DPS lost: " + change.reason, true));
            }
        }
    }
    sendEventUp(event);
}

void ProvisioningStage::handleResponse(const topics::DpsResponse& response, const std::string& body) {
    OperationPtr op = requests_.take(response.rid);
    if (!op) {
        std::cout << "[DPS] Ignoring response for unknown $rid=" << response.rid << std::endl;
        return;
    }
    if (active_.count(op->id()) == 0) {
        return;
    }

    if (response.status >= 300) {
        const bool retryable = response.status == 429 || response.status >= 500;
        auto error = Error::service("DPS request failed with status " + std::to_string(response.status) +
                                    ": " + JsonCodec::errorMessage(body), retryable);
        if (retryable && response.retryAfter) {
            error.retryAfter = std::chrono::duration_cast<std::chrono::milliseconds>(*response.retryAfter);
        }
        std::cerr << "[DPS] " << op->name() << " " << error.message << std::endl;
        finish(op, error);
        return;
    }

    RegistrationResult result;
    try {
        result = JsonCodec::parseRegistrationResult(body);
    } catch (const nlohmann::json::exception& e) {
        finish(op, Error::service(std::string("Malformed DPS response: ") + e.what()));
        return;
    }

    std::visit(Overloaded{
        [&](ops::RegisterDevice& p) { p.result = result; },
        [&](ops::QueryRegistrationStatus& p) { p.result = result; },
        [](auto&) {}
    }, op->payload());

    if (result.status == "assigning") {
        if (result.operationId.empty()) {
            finish(op, Error::service("DPS reported 'assigning' without an operation id"));
            return;
        }
        std::cout << "[DPS] Device assignment in progress, operation ID: " << result.operationId << std::endl;
        const auto delay = response.retryAfter
            ? std::chrono::duration_cast<std::chrono::milliseconds>(*response.retryAfter)
            : options_.pollingInterval;
        schedulePoll(op, result.operationId, delay);
        return;
    }

    if (result.isAssigned()) {
        std::cout << "[DPS] Successfully provisioned device " << result.registrationState.deviceId
                  << " to hub " << result.registrationState.assignedHub << std::endl;
        finish(op, std::nullopt);
        return;
    }

    std::string message = "Registration ended with status '" + result.status + "'";
    if (!result.registrationState.errorMessage.empty()) {
        message += ": " + result.registrationState.errorMessage;
    }
    std::cerr << "[DPS] " << message << std::endl;
    finish(op, Error::service(message));
}

void ProvisioningStage::schedulePoll(const OperationPtr& op, const std::string& operationId,
                                     std::chrono::milliseconds delay) {
    const bool posted = context().executor().postDelayed(delay, [this, op, operationId] {
        if (active_.count(op->id()) == 0) {
            return;
        }
        sendQuery(op, operationId);
    });
    if (!posted) {
        finish(op, Error::shuttingDown());
    }
}

void ProvisioningStage::onDeadline(std::uint64_t opId) {
    auto it = active_.find(opId);
    if (it == active_.end()) {
        return;
    }
    OperationPtr op = it->second;
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(options_.timeout).count();
    std::cerr << "[DPS] " << op->name() << " timed out after " << seconds << "s" << std::endl;
    finish(op, Error::timeout("Provisioning did not complete within " + std::to_string(seconds) + "s"));
}

void ProvisioningStage::finish(const OperationPtr& op, const std::optional<Error>& error) {
    if (active_.erase(op->id()) == 0) {
        return;
    }
    requests_.untrack(op);
    op->complete(error);
}

void ProvisioningStage::failAll(const Error& error) {
    std::vector<OperationPtr> ops;
    for (const auto& entry : active_) {
        ops.push_back(entry.second);
    }
    for (const auto& op : ops) {
        finish(op, error);
    }
}

void ProvisioningStage::onShutdown(const Error& reason) {
    failAll(reason);
    requests_.takeAll();
}

} // namespace iotpipe::stages
