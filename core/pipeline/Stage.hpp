/**
 * @file Stage.hpp
 * @brief Base class of every pipeline stage
 *
 * Operations enter through run() and flow towards the tail, events enter
 * through handleEvent() and flow towards the head. Subclasses override
 * runOp() and onEvent() for the kinds they transform and hand everything
 * else on with passOpToNextStage() and sendEventUp().
 */

#pragma once

#include "Error.hpp"
#include "Event.hpp"
#include "Operation.hpp"
#include <memory>
#include <string>

namespace iotpipe::pipeline {

class PipelineContext;

class Stage {
public:
    explicit Stage(std::string name);
    virtual ~Stage() = default;

    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    const std::string& name() const { return name_; }

    /**
     * @brief Process an operation on the pipeline thread
     *
     * An exception escaping runOp() completes the operation with the
     * matching error. PipelineFatalError, and any exception thrown after the
     * operation was already completed, propagates to the caller.
     *
     * @throws ThreadAffinityError when called off the pipeline thread
     */
    void run(const OperationPtr& op);

    /// Process an event on the pipeline thread; failures go to the background error handler
    void handleEvent(const EventPtr& event);

    /// Fail every operation this stage has parked
    void shutdown(const Error& reason);

    /**
     * @brief Forward an operation unchanged to the next stage
     *
     * With no next stage the operation is completed with a Configuration
     * error: nothing downstream is left to handle its kind.
     */
    void passOpToNextStage(const OperationPtr& op);

    /// Forward an event to the previous stage, or to the pipeline sink from the head
    void sendEventUp(const EventPtr& event);

    Stage* next() const { return next_.get(); }
    Stage* previous() const { return previous_; }

    /**
     * @brief Append the next stage
     * @throws PipelineConfigurationError if a next stage is already linked
     *         or the stage is already attached to a pipeline
     */
    void setNext(std::unique_ptr<Stage> next);

    /// Bind this stage and every stage after it to the owning pipeline
    void attach(PipelineContext& context);

    bool isAttached() const { return context_ != nullptr; }

protected:
    virtual void runOp(const OperationPtr& op);
    virtual void onEvent(const EventPtr& event);
    virtual void onShutdown(const Error& reason);
    virtual void onAttached();

    /// @throws PipelineConfigurationError before attach()
    PipelineContext& context() const;

    /// @throws ThreadAffinityError unless running on the pipeline's executor
    void requirePipelineThread(const char* where) const;

private:
    std::string name_;
    std::unique_ptr<Stage> next_;
    Stage* previous_ = nullptr;
    PipelineContext* context_ = nullptr;
};

} // namespace iotpipe::pipeline
