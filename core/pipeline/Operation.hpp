/**
 * @file Operation.hpp
 * @brief Unit of work flowing down a pipeline
 *
 * An operation is created once, validated at construction, travels through
 * any number of stages and is completed exactly once. Completion runs the
 * callback with the outcome; a second completion throws
 * OperationAlreadyCompletedError.
 */

#pragma once

#include "Error.hpp"
#include "Ops.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace iotpipe::pipeline {

class Operation;
using OperationPtr = std::shared_ptr<Operation>;
using OperationCallback = std::function<void(Operation& op, const std::optional<Error>& error)>;

class Operation {
public:
    /**
     * @brief Create a validated operation
     * @param payload Kind-specific payload
     * @param callback Completion callback, may be set later with setCallback()
     * @throws ValidationError if a mandatory field is missing or malformed
     */
    static OperationPtr create(ops::Payload payload, OperationCallback callback = nullptr);

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    std::uint64_t id() const { return id_; }
    OperationKind kind() const;

    /// Kind and id, e.g. "RegisterDevice#7"
    std::string name() const;

    const ops::Payload& payload() const { return payload_; }
    ops::Payload& payload() { return payload_; }

    template <class T>
    bool is() const { return std::holds_alternative<T>(payload_); }

    template <class T>
    T& as() { return std::get<T>(payload_); }

    template <class T>
    const T& as() const { return std::get<T>(payload_); }

    /// @throws PipelineConfigurationError if a callback is already installed
    void setCallback(OperationCallback callback);
    bool hasCallback() const { return static_cast<bool>(callback_); }
    /// Remove and return the installed callback, leaving none
    OperationCallback takeCallback();

    bool isCompleted() const { return completed_.load(); }

    /// Outcome, meaningful once isCompleted()
    const std::optional<Error>& error() const { return error_; }

    /**
     * @brief Record the outcome and invoke the callback
     * @param error std::nullopt on success
     * @throws OperationAlreadyCompletedError when called a second time
     */
    void complete(std::optional<Error> error = std::nullopt);

    /**
     * @brief Complete with error unless already completed
     * @return true if this call completed the operation
     * @note Reserved for teardown sweeps, normal paths use complete()
     */
    bool completeIfPending(const Error& error);

private:
    Operation(ops::Payload payload, OperationCallback callback);

    static void validate(const ops::Payload& payload);
    void finish(std::optional<Error> error);

    static std::atomic<std::uint64_t> nextId_;

    const std::uint64_t id_;
    ops::Payload payload_;
    OperationCallback callback_;
    std::optional<Error> error_;
    std::atomic<bool> completed_{false};
};

} // namespace iotpipe::pipeline
