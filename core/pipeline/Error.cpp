#include "Error.hpp"

#include <utility>

namespace iotpipe::pipeline {

Error Error::validation(std::string message) {
    return Error{ErrorCode::Validation, std::move(message), false, std::nullopt};
}

Error Error::configuration(std::string message) {
    return Error{ErrorCode::Configuration, std::move(message), false, std::nullopt};
}

Error Error::transport(std::string message, bool retryable) {
    return Error{ErrorCode::Transport, std::move(message), retryable, std::nullopt};
}

Error Error::service(std::string message, bool retryable) {
    return Error{ErrorCode::Service, std::move(message), retryable, std::nullopt};
}

Error Error::timeout(std::string message) {
    return Error{ErrorCode::Timeout, std::move(message), false, std::nullopt};
}

Error Error::shuttingDown(std::string message) {
    return Error{ErrorCode::ShuttingDown, std::move(message), false, std::nullopt};
}

Error Error::unexpected(std::string message) {
    return Error{ErrorCode::Unexpected, std::move(message), false, std::nullopt};
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation:    return "validation";
        case ErrorCode::Configuration: return "configuration";
        case ErrorCode::Transport:     return "transport";
        case ErrorCode::Service:       return "service";
        case ErrorCode::Timeout:       return "timeout";
        case ErrorCode::ShuttingDown:  return "shutting_down";
        case ErrorCode::Unexpected:    return "unexpected";
    }
    return "unknown";
}

std::string toString(const Error& error) {
    return errorCodeToString(error.code) + ": " + error.message;
}

Error errorFromException(const std::exception& e) {
    if (dynamic_cast<const ValidationError*>(&e) != nullptr) {
        return Error::validation(e.what());
    }
    if (dynamic_cast<const PipelineConfigurationError*>(&e) != nullptr) {
        return Error::configuration(e.what());
    }
    return Error::unexpected(e.what());
}

} // namespace iotpipe::pipeline
