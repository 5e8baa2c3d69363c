/**
 * @file Pipeline.hpp
 * @brief Root object owning a chain of stages and its executor
 *
 * Every public entry point is thread-safe and marshals onto the executor.
 * Operations submitted from one thread reach the head stage in submission
 * order.
 */

#pragma once

#include "Operation.hpp"
#include "PipelineContext.hpp"
#include "Stage.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace iotpipe::pipeline {

class Pipeline {
public:
    /**
     * @brief Link stages head to tail and bind them to this pipeline
     * @param executor Serialization context, stopped when the pipeline shuts down
     * @param stages Chain in head-to-tail order, at least one stage
     * @throws PipelineConfigurationError on an empty or null stage list
     */
    Pipeline(std::shared_ptr<ports::IExecutor> executor, std::vector<std::unique_ptr<Stage>> stages);

    /// Shuts the pipeline down if shutdown() was not called yet
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /**
     * @brief Submit an operation to the head stage
     *
     * After shutdown the operation is completed at once, on the calling
     * thread, with a ShuttingDown error. An exception thrown by the
     * completion callback goes to the background error handler instead of
     * the stage that completed the operation.
     *
     * @throws std::invalid_argument if op is null
     * @throws ValidationError if op has no completion callback
     */
    void runOp(const OperationPtr& op);

    /// Create, validate and submit an operation in one step
    OperationPtr submit(ops::Payload payload, OperationCallback callback);

    /// Receives every event that leaves the head stage, on the pipeline thread
    void registerEventSink(PipelineContext::EventSink sink);

    void setBackgroundErrorHandler(PipelineContext::BackgroundErrorHandler handler);

    bool isConnected() const { return context_.isConnected(); }

    /// Submitted operations that have not completed yet
    std::size_t pendingOperations() const;

    /**
     * @brief Stop accepting work and fail everything still pending
     *
     * Stages are asked tail first to fail their parked operations, then any
     * remaining submitted operation is completed with ShuttingDown and the
     * executor is stopped. Idempotent. Called off the pipeline thread it
     * waits for the executor to stop, also when an earlier call made from a
     * completion callback already began the teardown.
     */
    void shutdown();

    Stage& head() { return *head_; }
    PipelineContext& context() { return context_; }

private:
    void runOnHead(const OperationPtr& op);
    void teardown();
    void forget(const Operation& op);

    PipelineContext context_;
    std::unique_ptr<Stage> head_;

    mutable std::mutex mutex_;
    bool accepting_ = true;
    std::vector<OperationPtr> pending_;
};

} // namespace iotpipe::pipeline
