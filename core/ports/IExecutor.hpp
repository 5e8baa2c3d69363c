#pragma once

#include <chrono>
#include <exception>
#include <functional>

namespace iotpipe::ports {

/**
 * @brief Serialization context that runs all stage logic of one pipeline
 *
 * Tasks run one at a time in submission order. Timers fire in due order and
 * queue behind tasks that are already waiting.
 */
class IExecutor {
public:
    using Task = std::function<void()>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    virtual ~IExecutor() = default;

    /// @return false once the executor has been stopped
    virtual bool post(Task task) = 0;
    virtual bool postDelayed(std::chrono::milliseconds delay, Task task) = 0;

    /// True only when called from inside a task run by this executor
    virtual bool isCurrentContext() const = 0;

    virtual std::chrono::steady_clock::time_point now() const = 0;

    /// Runs every task already queued, discards pending timers, then refuses new work
    virtual void stop() = 0;

    /// Receives exceptions escaping a task
    virtual void setErrorHandler(ErrorHandler handler) = 0;
};

} // namespace iotpipe::ports
