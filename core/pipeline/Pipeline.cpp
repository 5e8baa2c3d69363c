#include "Pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace iotpipe::pipeline {

Pipeline::Pipeline(std::shared_ptr<ports::IExecutor> executor, std::vector<std::unique_ptr<Stage>> stages)
    : context_(std::move(executor)) {
    if (stages.empty()) {
        throw PipelineConfigurationError("Pipeline requires at least one stage");
    }
    for (const auto& stage : stages) {
        if (!stage) {
            throw PipelineConfigurationError("Pipeline stage must not be null");
        }
    }

    // Link back to front so each stage takes ownership of its successor
    for (std::size_t i = stages.size() - 1; i > 0; --i) {
        stages[i - 1]->setNext(std::move(stages[i]));
    }
    head_ = std::move(stages.front());
    head_->attach(context_);

    context_.executor().setErrorHandler([this](std::exception_ptr error) {
        context_.reportBackgroundError(error);
    });
}

Pipeline::~Pipeline() {
    shutdown();
    context_.executor().setErrorHandler(nullptr);
}

void Pipeline::runOp(const OperationPtr& op) {
    if (!op) {
        throw std::invalid_argument("Pipeline::runOp requires an operation");
    }
    if (!op->hasCallback()) {
        throw ValidationError(op->name() + " submitted without a completion callback");
    }

    op->setCallback([this, callback = op->takeCallback()](Operation& done, const std::optional<Error>& error) {
        forget(done);
        try {
            callback(done, error);
        } catch (...) {
            context_.reportBackgroundError(std::current_exception());
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accepting_) {
            pending_.push_back(op);
            if (context_.executor().post([this, op] { runOnHead(op); })) {
                return;
            }
            pending_.pop_back();
        }
    }

    std::cerr << "[Pipeline] Rejecting " << op->name() << ": pipeline is shutting down" << std::endl;
    op->completeIfPending(Error::shuttingDown());
}

OperationPtr Pipeline::submit(ops::Payload payload, OperationCallback callback) {
    auto op = Operation::create(std::move(payload), std::move(callback));
    runOp(op);
    return op;
}

void Pipeline::registerEventSink(PipelineContext::EventSink sink) {
    context_.setEventSink(std::move(sink));
}

void Pipeline::setBackgroundErrorHandler(PipelineContext::BackgroundErrorHandler handler) {
    context_.setBackgroundErrorHandler(std::move(handler));
}

std::size_t Pipeline::pendingOperations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Pipeline::forget(const Operation& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&op](const OperationPtr& p) { return p.get() == &op; }),
                   pending_.end());
}

void Pipeline::runOnHead(const OperationPtr& op) {
    if (op->isCompleted()) {
        return;
    }
    if (context_.isShuttingDown()) {
        op->complete(Error::shuttingDown());
        return;
    }
    head_->run(op);
}

void Pipeline::shutdown() {
    bool first = false;
    bool inContext = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inContext = context_.executor().isCurrentContext();
        if (accepting_) {
            accepting_ = false;
            first = true;
            if (!inContext && !context_.executor().post([this] { teardown(); })) {
                std::cerr << "[Pipeline] Executor already stopped, cannot tear stages down" << std::endl;
            }
        }
    }

    if (first && inContext) {
        teardown();
    }
    // A repeated call still stops the executor so that, off the pipeline
    // thread, it returns only once the worker is done with this pipeline
    context_.executor().stop();
}

void Pipeline::teardown() {
    context_.setShuttingDown();
    const Error reason = Error::shuttingDown();

    std::vector<Stage*> chain;
    for (Stage* stage = head_.get(); stage != nullptr; stage = stage->next()) {
        chain.push_back(stage);
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        (*it)->shutdown(reason);
    }

    std::vector<OperationPtr> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }

    std::size_t failed = 0;
    for (const auto& op : pending) {
        if (op->completeIfPending(reason)) {
            ++failed;
        }
    }
    std::cout << "[Pipeline] Shut down, " << failed << " pending operation(s) failed" << std::endl;
}

} // namespace iotpipe::pipeline
