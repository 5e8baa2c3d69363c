#include "ThreadExecutor.hpp"

#include <iostream>
#include <utility>

namespace iotpipe::adapters {

ThreadExecutor::ThreadExecutor(std::string name)
    : name_(std::move(name)),
      worker_([this] { workerLoop(); }) {
}

ThreadExecutor::~ThreadExecutor() {
    stop();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

bool ThreadExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    wakeup_.notify_one();
    return true;
}

bool ThreadExecutor::postDelayed(std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        timers_.push(Timer{now() + delay, timerSequence_++, std::move(task)});
    }
    wakeup_.notify_one();
    return true;
}

bool ThreadExecutor::isCurrentContext() const {
    return std::this_thread::get_id() == worker_.get_id();
}

std::chrono::steady_clock::time_point ThreadExecutor::now() const {
    return std::chrono::steady_clock::now();
}

void ThreadExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        timers_ = decltype(timers_)();
    }
    wakeup_.notify_one();

    if (!isCurrentContext() && worker_.joinable()) {
        worker_.join();
    }
}

void ThreadExecutor::setErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorHandler_ = std::move(handler);
}

void ThreadExecutor::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        const auto current = now();
        while (!timers_.empty() && timers_.top().due <= current) {
            tasks_.push_back(std::move(const_cast<Timer&>(timers_.top()).task));
            timers_.pop();
        }

        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            runTask(task);
            lock.lock();
            continue;
        }

        if (stopping_) {
            break;
        }

        if (timers_.empty()) {
            wakeup_.wait(lock);
        } else {
            wakeup_.wait_until(lock, timers_.top().due);
        }
    }
}

void ThreadExecutor::runTask(Task& task) {
    try {
        task();
    } catch (...) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = errorHandler_;
        }
        if (handler) {
            handler(std::current_exception());
        } else {
            std::cerr << "[Executor] " << name_ << ": task failed with no error handler installed" << std::endl;
            throw;
        }
    }
}

} // namespace iotpipe::adapters
