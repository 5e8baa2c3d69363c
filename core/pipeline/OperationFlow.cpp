#include "OperationFlow.hpp"
#include "Stage.hpp"

#include <iostream>
#include <memory>
#include <utility>

namespace iotpipe::pipeline {

namespace {

void submitStep(Stage& stage, const OperationPtr& original,
                const std::shared_ptr<std::vector<OperationPtr>>& steps, std::size_t index) {
    if (index == steps->size()) {
        original->complete();
        return;
    }

    const OperationPtr& step = (*steps)[index];
    step->setCallback([&stage, original, steps, index](Operation& done, const std::optional<Error>& error) {
        if (sweptAtTeardown(original)) {
            return;
        }
        if (error) {
            std::cerr << "[" << stage.name() << "] " << done.name() << " (step " << index + 1 << " of "
                      << steps->size() << " for " << original->name() << ") failed: "
                      << toString(*error) << std::endl;
            original->complete(error);
            return;
        }
        submitStep(stage, original, steps, index + 1);
    });
    stage.passOpToNextStage(step);
}

} // namespace

bool sweptAtTeardown(const OperationPtr& original) {
    return original->isCompleted() && original->error() &&
           original->error()->code == ErrorCode::ShuttingDown;
}

void completeOp(const OperationPtr& op, std::optional<Error> error) {
    op->complete(std::move(error));
}

void delegateToDifferentOp(Stage& stage, const OperationPtr& original, const OperationPtr& replacement) {
    replacement->setCallback([original](Operation&, const std::optional<Error>& error) {
        if (sweptAtTeardown(original)) {
            return;
        }
        original->complete(error);
    });
    stage.passOpToNextStage(replacement);
}

void delegateSequence(Stage& stage, const OperationPtr& original, std::vector<OperationPtr> steps) {
    auto shared = std::make_shared<std::vector<OperationPtr>>(std::move(steps));
    submitStep(stage, original, shared, 0);
}

} // namespace iotpipe::pipeline
