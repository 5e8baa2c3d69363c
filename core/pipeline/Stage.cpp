#include "Stage.hpp"
#include "PipelineContext.hpp"

#include <iostream>
#include <utility>

namespace iotpipe::pipeline {

Stage::Stage(std::string name) : name_(std::move(name)) {}

void Stage::run(const OperationPtr& op) {
    requirePipelineThread("run");
    try {
        runOp(op);
    } catch (const PipelineFatalError&) {
        throw;
    } catch (const std::exception& e) {
        if (op->isCompleted()) {
            throw;
        }
        std::cerr << "[" << name_ << "] " << op->name() << " failed: " << e.what() << std::endl;
        op->complete(errorFromException(e));
    }
}

void Stage::handleEvent(const EventPtr& event) {
    requirePipelineThread("handleEvent");
    try {
        onEvent(event);
    } catch (const PipelineFatalError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] " << event->name() << " handling failed: " << e.what() << std::endl;
        context().reportBackgroundError(std::current_exception());
    }
}

void Stage::shutdown(const Error& reason) {
    requirePipelineThread("shutdown");
    onShutdown(reason);
}

void Stage::passOpToNextStage(const OperationPtr& op) {
    if (!next_) {
        std::cerr << "[" << name_ << "] FATAL: no stage handles " << op->name()
                  << " and none remain" << std::endl;
        op->complete(Error::configuration(
            "No stage handles " + operationKindToString(op->kind()) + " and none remain after " + name_));
        return;
    }
    next_->run(op);
}

void Stage::sendEventUp(const EventPtr& event) {
    if (previous_) {
        previous_->handleEvent(event);
    } else {
        context().deliverEvent(event);
    }
}

void Stage::setNext(std::unique_ptr<Stage> next) {
    if (next_) {
        throw PipelineConfigurationError(name_ + " already has a next stage");
    }
    if (context_) {
        throw PipelineConfigurationError(name_ + " is already attached to a pipeline");
    }
    if (!next) {
        throw PipelineConfigurationError(name_ + ": next stage must not be null");
    }
    next->previous_ = this;
    next_ = std::move(next);
}

void Stage::attach(PipelineContext& context) {
    for (Stage* stage = this; stage != nullptr; stage = stage->next_.get()) {
        if (stage->context_) {
            throw PipelineConfigurationError(stage->name_ + " is already attached to a pipeline");
        }
        stage->context_ = &context;
        stage->onAttached();
    }
}

void Stage::runOp(const OperationPtr& op) {
    passOpToNextStage(op);
}

void Stage::onEvent(const EventPtr& event) {
    sendEventUp(event);
}

void Stage::onShutdown(const Error& reason) {
    (void)reason;
}

void Stage::onAttached() {
}

PipelineContext& Stage::context() const {
    if (!context_) {
        throw PipelineConfigurationError(name_ + " is not attached to a pipeline");
    }
    return *context_;
}

void Stage::requirePipelineThread(const char* where) const {
    if (!context().executor().isCurrentContext()) {
        throw ThreadAffinityError(name_ + "::" + where + " called off the pipeline thread");
    }
}

} // namespace iotpipe::pipeline
