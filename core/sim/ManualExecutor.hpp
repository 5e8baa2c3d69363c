#pragma once

#include "../ports/IExecutor.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace iotpipe::sim {

/**
 * @brief Deterministic executor for tests
 *
 * Nothing runs until the test drives it. Time is virtual: it starts at an
 * arbitrary epoch and only moves in advance().
 */
class ManualExecutor : public ports::IExecutor {
public:
    ManualExecutor();
    ~ManualExecutor() override = default;

    bool post(Task task) override;
    bool postDelayed(std::chrono::milliseconds delay, Task task) override;
    bool isCurrentContext() const override;
    std::chrono::steady_clock::time_point now() const override;

    /// Runs queued tasks inline when called from outside a task
    void stop() override;

    void setErrorHandler(ErrorHandler handler) override;

    /**
     * @brief Run tasks until the queue is empty
     * @return Number of tasks run
     * @note Timers that are not yet due stay queued
     */
    std::size_t runUntilIdle();

    /// Move virtual time forward, firing due timers in order, then run until idle
    std::size_t advance(std::chrono::milliseconds duration);

    std::size_t pendingTasks() const;
    std::size_t pendingTimers() const;

    /// Delay until the earliest timer is due, zero if none
    std::chrono::milliseconds nextTimerDelay() const;

    bool isStopped() const;

private:
    bool runOne();

    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
    std::multimap<std::chrono::steady_clock::time_point, Task> timers_;
    std::chrono::steady_clock::time_point now_;
    std::thread::id runningOn_;
    bool stopped_ = false;
    ErrorHandler errorHandler_;
};

} // namespace iotpipe::sim
