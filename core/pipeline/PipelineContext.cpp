#include "PipelineContext.hpp"
#include "Error.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace iotpipe::pipeline {

namespace {

void defaultBackgroundErrorHandler(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const PipelineFatalError& e) {
        std::cerr << "[Pipeline] FATAL: " << e.what() << std::endl;
        std::terminate();
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Background error: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[Pipeline] Background error of unknown type" << std::endl;
    }
}

} // namespace

PipelineContext::PipelineContext(std::shared_ptr<ports::IExecutor> executor)
    : executor_(std::move(executor)),
      errorHandler_(defaultBackgroundErrorHandler) {
    if (!executor_) {
        throw std::invalid_argument("Pipeline requires an executor");
    }
}

void PipelineContext::setEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventSink_ = std::move(sink);
}

void PipelineContext::deliverEvent(const EventPtr& event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = eventSink_;
    }
    if (sink) {
        sink(event);
    } else {
        std::cout << "[Pipeline] No event sink, dropping " << event->name() << std::endl;
    }
}

void PipelineContext::setBackgroundErrorHandler(BackgroundErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorHandler_ = handler ? std::move(handler) : defaultBackgroundErrorHandler;
}

void PipelineContext::reportBackgroundError(std::exception_ptr error) {
    BackgroundErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = errorHandler_;
    }
    handler(error);
}

} // namespace iotpipe::pipeline
