#pragma once

#include "../pipeline/Stage.hpp"
#include "../ports/IRetryPolicy.hpp"
#include <cstdint>
#include <map>
#include <memory>

namespace iotpipe::stages {

/**
 * @brief Reissues operations whose attempt failed with a retryable error
 *
 * Each attempt is a fresh copy of the original payload sent to the next
 * stage. The delay before attempt n+1 is the policy's backoff for n,
 * lengthened to the error's retryAfter hint. Non-retryable errors and
 * exhausted attempts complete the original with the last error.
 */
class RetryStage : public pipeline::Stage {
public:
    explicit RetryStage(std::shared_ptr<ports::RetryPolicy> policy);

    static bool isRetryableKind(pipeline::OperationKind kind);

    std::size_t waitingCount() const { return waiting_.size(); }

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    void attempt(const pipeline::OperationPtr& original, int attemptNumber);
    void onAttemptDone(const pipeline::OperationPtr& original, pipeline::Operation& attemptOp,
                       int attemptNumber, const std::optional<pipeline::Error>& error);
    void scheduleRetry(const pipeline::OperationPtr& original, int attemptNumber, const pipeline::Error& error);
    void fireRetry(std::uint64_t timerId, int nextAttempt);

    std::shared_ptr<ports::RetryPolicy> policy_;
    std::uint64_t nextTimerId_ = 1;
    std::map<std::uint64_t, pipeline::OperationPtr> waiting_;
};

} // namespace iotpipe::stages
