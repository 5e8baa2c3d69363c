/**
 * @file Error.hpp
 * @brief Error model shared by every pipeline stage
 *
 * Operation outcomes travel as std::optional<Error> through completion
 * callbacks. Programming-error classes are exceptions derived from
 * PipelineFatalError and are never folded into an operation's outcome.
 */

#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace iotpipe::pipeline {

/**
 * @brief Category of an operation failure
 *
 * Validation and Configuration indicate caller or wiring bugs, Transport and
 * Service come from below the pipeline, ShuttingDown is reported for work
 * still pending at teardown.
 */
enum class ErrorCode {
    Validation,
    Configuration,
    Transport,
    Service,
    Timeout,
    ShuttingDown,
    Unexpected
};

/**
 * @brief Outcome attached to a failed operation
 */
struct Error {
    ErrorCode code = ErrorCode::Unexpected;
    std::string message;
    bool retryable = false;                                 ///< Retry stage may reissue the operation
    std::optional<std::chrono::milliseconds> retryAfter;    ///< Minimum delay requested by the service

    static Error validation(std::string message);
    static Error configuration(std::string message);
    static Error transport(std::string message, bool retryable = true);
    static Error service(std::string message, bool retryable = false);
    static Error timeout(std::string message);
    static Error shuttingDown(std::string message = "Pipeline is shutting down");
    static Error unexpected(std::string message);
};

std::string errorCodeToString(ErrorCode code);
std::string toString(const Error& error);

/// Missing or malformed mandatory field at operation construction
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Stage wiring bug, e.g. a stage used before it was attached to a pipeline
class PipelineConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Defect classes that must fail loudly instead of completing an operation
class PipelineFatalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class OperationAlreadyCompletedError : public PipelineFatalError {
public:
    using PipelineFatalError::PipelineFatalError;
};

class ThreadAffinityError : public PipelineFatalError {
public:
    using PipelineFatalError::PipelineFatalError;
};

/**
 * @brief Map an exception caught inside a stage onto an operation error
 * @param e Exception thrown while the stage processed an operation
 * @return Error with Validation, Configuration or Unexpected code
 */
Error errorFromException(const std::exception& e);

} // namespace iotpipe::pipeline
