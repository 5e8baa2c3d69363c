#include "RetryStage.hpp"
#include "../pipeline/OperationFlow.hpp"
#include "../pipeline/PipelineContext.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace iotpipe::stages {

using namespace pipeline;

RetryStage::RetryStage(std::shared_ptr<ports::RetryPolicy> policy)
    : Stage("RetryStage"), policy_(std::move(policy)) {
    if (!policy_) {
        throw std::invalid_argument("RetryStage: retry policy cannot be null");
    }
}

bool RetryStage::isRetryableKind(OperationKind kind) {
    switch (kind) {
        case OperationKind::RegisterDevice:
        case OperationKind::QueryRegistrationStatus:
        case OperationKind::SendTelemetry:
        case OperationKind::SendMethodResponse:
        case OperationKind::GetTwin:
        case OperationKind::PatchTwinReportedProperties:
        case OperationKind::EnableFeature:
            return true;
        default:
            return false;
    }
}

void RetryStage::runOp(const OperationPtr& op) {
    if (!isRetryableKind(op->kind())) {
        passOpToNextStage(op);
        return;
    }
    attempt(op, 1);
}

void RetryStage::attempt(const OperationPtr& original, int attemptNumber) {
    auto attemptOp = Operation::create(original->payload(),
        [this, original, attemptNumber](Operation& done, const std::optional<Error>& error) {
            onAttemptDone(original, done, attemptNumber, error);
        });
    passOpToNextStage(attemptOp);
}

void RetryStage::onAttemptDone(const OperationPtr& original, Operation& attemptOp,
                               int attemptNumber, const std::optional<Error>& error) {
    if (sweptAtTeardown(original)) {
        return;
    }

    if (!error) {
        // Results (registration state, twin, reported version) live in the payload
        original->payload() = attemptOp.payload();
        original->complete();
        return;
    }

    if (!error->retryable || context().isShuttingDown()) {
        original->complete(error);
        return;
    }

    if (!policy_->shouldRetry(attemptNumber)) {
        std::cerr << "[Retry] " << original->name() << " giving up after " << attemptNumber
                  << " attempt(s): " << toString(*error) << std::endl;
        original->complete(error);
        return;
    }

    scheduleRetry(original, attemptNumber, *error);
}

void RetryStage::scheduleRetry(const OperationPtr& original, int attemptNumber, const Error& error) {
    auto delay = policy_->getBackoffDelay(attemptNumber);
    if (error.retryAfter && *error.retryAfter > delay) {
        delay = *error.retryAfter;
    }

    const std::uint64_t timerId = nextTimerId_++;
    waiting_.emplace(timerId, original);

    std::cout << "[Retry] " << original->name() << " attempt " << attemptNumber << " failed ("
              << toString(error) << "), retrying in " << delay.count() << "ms" << std::endl;

    const int nextAttempt = attemptNumber + 1;
    if (!context().executor().postDelayed(delay, [this, timerId, nextAttempt] { fireRetry(timerId, nextAttempt); })) {
        waiting_.erase(timerId);
        original->complete(error);
    }
}

void RetryStage::fireRetry(std::uint64_t timerId, int nextAttempt) {
    auto it = waiting_.find(timerId);
    if (it == waiting_.end()) {
        return;
    }
    OperationPtr original = std::move(it->second);
    waiting_.erase(it);

    // Timer tasks bypass run(), so apply the same guard here
    try {
        attempt(original, nextAttempt);
    } catch (const PipelineFatalError&) {
        throw;
    } catch (const std::exception& e) {
        if (original->isCompleted()) {
            throw;
        }
        original->complete(errorFromException(e));
    }
}

void RetryStage::onShutdown(const Error& reason) {
    auto waiting = std::move(waiting_);
    waiting_.clear();
    for (auto& entry : waiting) {
        entry.second->complete(reason);
    }
}

} // namespace iotpipe::stages
