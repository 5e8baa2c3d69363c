/**
 * @file OperationFlow.hpp
 * @brief Helpers that route operations between stages
 *
 * All helpers run on the pipeline thread. Delegated operations always go to
 * the next stage of the delegating stage, never back into it.
 */

#pragma once

#include "Operation.hpp"
#include <optional>
#include <vector>

namespace iotpipe::pipeline {

class Stage;

/**
 * @brief True if original was failed by the pipeline's teardown sweep
 *
 * Callbacks of operations still below at teardown use this to drop their
 * late completion instead of completing the original a second time.
 */
bool sweptAtTeardown(const OperationPtr& original);

/// Complete op exactly once, throws OperationAlreadyCompletedError otherwise
void completeOp(const OperationPtr& op, std::optional<Error> error = std::nullopt);

/**
 * @brief Replace original with a different operation further down
 *
 * When replacement completes, original completes with the same error (or
 * success). replacement must not carry a callback yet.
 */
void delegateToDifferentOp(Stage& stage, const OperationPtr& original, const OperationPtr& replacement);

/**
 * @brief Replace original with an ordered list of operations
 *
 * Step N+1 is submitted only after step N succeeded. The first failure
 * completes original with that error and no later step is issued. Original
 * succeeds after the last step succeeds; an empty list completes it at once.
 */
void delegateSequence(Stage& stage, const OperationPtr& original, std::vector<OperationPtr> steps);

} // namespace iotpipe::pipeline
