#include "ConnectionStage.hpp"
#include "../pipeline/OperationFlow.hpp"
#include "../pipeline/PipelineContext.hpp"

#include <iostream>
#include <utility>

namespace iotpipe::stages {

using namespace pipeline;

bool ConnectionStage::needsConnection(OperationKind kind) {
    switch (kind) {
        case OperationKind::RegisterDevice:
        case OperationKind::QueryRegistrationStatus:
        case OperationKind::SendTelemetry:
        case OperationKind::SendMethodResponse:
        case OperationKind::EnableFeature:
        case OperationKind::GetTwin:
        case OperationKind::PatchTwinReportedProperties:
        case OperationKind::MqttPublish:
        case OperationKind::MqttSubscribe:
        case OperationKind::MqttUnsubscribe:
            return true;
        default:
            return false;
    }
}

void ConnectionStage::runOp(const OperationPtr& op) {
    if (inFlight_) {
        waiting_.push_back(op);
        return;
    }

    switch (op->kind()) {
        case OperationKind::Connect:
            if (context().isConnected()) {
                op->complete();
            } else {
                changeConnection(op, true);
            }
            return;

        case OperationKind::Disconnect:
            if (!context().isConnected()) {
                op->complete();
            } else {
                changeConnection(op, false);
            }
            return;

        default:
            break;
    }

    if (needsConnection(op->kind()) && !context().isConnected()) {
        autoConnect(op);
        return;
    }
    passOpToNextStage(op);
}

void ConnectionStage::changeConnection(const OperationPtr& original, bool connect) {
    inFlight_ = true;
    auto sub = Operation::create(connect ? ops::Payload(ops::Connect{}) : ops::Payload(ops::Disconnect{}),
        [this, original, connect](Operation&, const std::optional<Error>& error) {
            inFlight_ = false;
            if (!error) {
                context().setConnected(connect);
            }
            if (!sweptAtTeardown(original)) {
                original->complete(error);
            }
            releaseWaiting(std::nullopt);
        });
    passOpToNextStage(sub);
}

void ConnectionStage::autoConnect(const OperationPtr& trigger) {
    std::cout << "[Connection] " << trigger->name() << " needs a connection, connecting first" << std::endl;

    inFlight_ = true;
    waiting_.push_back(trigger);
    auto sub = Operation::create(ops::Connect{}, [this](Operation&, const std::optional<Error>& error) {
        inFlight_ = false;
        if (error) {
            std::cerr << "[Connection] Automatic connect failed: " << toString(*error) << std::endl;
        } else {
            context().setConnected(true);
        }
        releaseWaiting(error);
    });
    passOpToNextStage(sub);
}

void ConnectionStage::releaseWaiting(const std::optional<Error>& connectError) {
    auto queue = std::move(waiting_);
    waiting_.clear();

    while (!queue.empty()) {
        OperationPtr op = std::move(queue.front());
        queue.pop_front();

        if (op->isCompleted()) {
            continue;
        }
        if (context().isShuttingDown()) {
            op->completeIfPending(Error::shuttingDown());
            continue;
        }
        if (inFlight_) {
            // A released Connect or Disconnect took the lock again
            waiting_.push_back(std::move(op));
            continue;
        }
        if (connectError && needsConnection(op->kind())) {
            op->complete(connectError);
            continue;
        }
        run(op);
    }
}

void ConnectionStage::onEvent(const EventPtr& event) {
    if (event->is<events::ConnectionStateChanged>()) {
        const auto& change = event->as<events::ConnectionStateChanged>();
        context().setConnected(change.connected);
        std::cout << "[Connection] " << (change.connected ? "Connected" : "Disconnected")
                  << (change.reason.empty() ? "" : ": " + change.reason) << std::endl;
    }
    sendEventUp(event);
}

void ConnectionStage::onShutdown(const Error& reason) {
    auto waiting = std::move(waiting_);
    waiting_.clear();
    for (auto& op : waiting) {
        op->completeIfPending(reason);
    }
}

} // namespace iotpipe::stages
