#pragma once

#include "../ports/IExecutor.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace iotpipe::adapters {

/**
 * @brief Executor backed by one worker thread
 *
 * Immediate tasks run in FIFO order. Delayed tasks wait in a timer queue
 * ordered by due time and are appended to the FIFO when due.
 */
class ThreadExecutor : public ports::IExecutor {
public:
    explicit ThreadExecutor(std::string name = "pipeline");
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    bool post(Task task) override;
    bool postDelayed(std::chrono::milliseconds delay, Task task) override;
    bool isCurrentContext() const override;
    std::chrono::steady_clock::time_point now() const override;

    /// Blocks until queued tasks ran, unless called from the worker itself
    void stop() override;

    void setErrorHandler(ErrorHandler handler) override;

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        std::uint64_t sequence;
        Task task;
    };

    struct TimerLater {
        bool operator()(const Timer& a, const Timer& b) const {
            return a.due != b.due ? a.due > b.due : a.sequence > b.sequence;
        }
    };

    void workerLoop();
    void runTask(Task& task);

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> tasks_;
    std::priority_queue<Timer, std::vector<Timer>, TimerLater> timers_;
    std::uint64_t timerSequence_ = 0;
    bool stopping_ = false;
    ErrorHandler errorHandler_;
    std::thread worker_;
};

} // namespace iotpipe::adapters
