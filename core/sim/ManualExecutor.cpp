#include "ManualExecutor.hpp"

namespace iotpipe::sim {

ManualExecutor::ManualExecutor()
    : now_(std::chrono::steady_clock::time_point() + std::chrono::hours(1)) {
}

bool ManualExecutor::post(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return false;
    }
    tasks_.push_back(std::move(task));
    return true;
}

bool ManualExecutor::postDelayed(std::chrono::milliseconds delay, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return false;
    }
    timers_.emplace(now_ + delay, std::move(task));
    return true;
}

bool ManualExecutor::isCurrentContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runningOn_ == std::this_thread::get_id();
}

std::chrono::steady_clock::time_point ManualExecutor::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualExecutor::stop() {
    bool nested = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        timers_.clear();
        nested = runningOn_ == std::this_thread::get_id();
    }
    if (!nested) {
        runUntilIdle();
    }
}

void ManualExecutor::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorHandler_ = std::move(handler);
}

std::size_t ManualExecutor::runUntilIdle() {
    std::size_t count = 0;
    while (runOne()) {
        ++count;
    }
    return count;
}

std::size_t ManualExecutor::advance(std::chrono::milliseconds duration) {
    std::size_t count = runUntilIdle();
    std::chrono::steady_clock::time_point target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + duration;
    }

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (timers_.empty() || timers_.begin()->first > target) {
                now_ = target;
                break;
            }
            auto first = timers_.begin();
            now_ = first->first;
            tasks_.push_back(std::move(first->second));
            timers_.erase(first);
        }
        count += runUntilIdle();
    }
    return count + runUntilIdle();
}

std::size_t ManualExecutor::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t ManualExecutor::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

std::chrono::milliseconds ManualExecutor::nextTimerDelay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timers_.empty()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(timers_.begin()->first - now_);
}

bool ManualExecutor::isStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

bool ManualExecutor::runOne() {
    Task task;
    std::thread::id previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
        previous = runningOn_;
        runningOn_ = std::this_thread::get_id();
    }

    try {
        task();
    } catch (...) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            runningOn_ = previous;
            handler = errorHandler_;
        }
        if (!handler) {
            throw;
        }
        handler(std::current_exception());
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    runningOn_ = previous;
    return true;
}

} // namespace iotpipe::sim
