#pragma once

#include "Event.hpp"
#include "../ports/IExecutor.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace iotpipe::pipeline {

/**
 * @brief State shared by every stage of one pipeline
 *
 * Owned by the Pipeline and outlives all of its stages.
 */
class PipelineContext {
public:
    using EventSink = std::function<void(const EventPtr& event)>;
    using BackgroundErrorHandler = std::function<void(std::exception_ptr error)>;

    explicit PipelineContext(std::shared_ptr<ports::IExecutor> executor);

    ports::IExecutor& executor() const { return *executor_; }
    const std::shared_ptr<ports::IExecutor>& executorPtr() const { return executor_; }

    bool isConnected() const { return connected_.load(); }
    void setConnected(bool connected) { connected_.store(connected); }

    bool isShuttingDown() const { return shuttingDown_.load(); }
    void setShuttingDown() { shuttingDown_.store(true); }

    void setEventSink(EventSink sink);

    /// Hand an event that left the head stage to the registered sink
    void deliverEvent(const EventPtr& event);

    void setBackgroundErrorHandler(BackgroundErrorHandler handler);

    /**
     * @brief Report an error that has no operation to complete
     *
     * The default handler logs the error and terminates the process on
     * PipelineFatalError.
     */
    void reportBackgroundError(std::exception_ptr error);

private:
    std::shared_ptr<ports::IExecutor> executor_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> shuttingDown_{false};

    mutable std::mutex mutex_;
    EventSink eventSink_;
    BackgroundErrorHandler errorHandler_;
};

} // namespace iotpipe::pipeline
