#pragma once

#include "../core/IClock.hpp"
#include "../core/pipeline/Operation.hpp"
#include "../core/pipeline/Pipeline.hpp"
#include "../core/pipeline/Stage.hpp"
#include "../core/ports/IAuthenticationProvider.hpp"
#include "../core/ports/IBlobUploader.hpp"
#include "../core/ports/ISecurityClient.hpp"
#include "../core/sim/ManualExecutor.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace iotpipe::test {

/**
 * @brief Terminal stage that records every operation it receives
 *
 * Operations are completed at once unless a failure is configured for their
 * kind or automatic completion is switched off, in which case they stay
 * parked until the test completes them or the pipeline shuts down.
 */
class RecordingStage : public pipeline::Stage {
public:
    explicit RecordingStage(std::string name = "RecordingStage") : Stage(std::move(name)) {}

    void setAutoComplete(bool autoComplete) { autoComplete_ = autoComplete; }
    void failKind(pipeline::OperationKind kind, pipeline::Error error) { failures_.insert_or_assign(kind, std::move(error)); }
    void throwOnKind(pipeline::OperationKind kind) { throwing_.push_back(kind); }

    const std::vector<pipeline::OperationPtr>& ops() const { return ops_; }
    pipeline::OperationPtr last() const { return ops_.empty() ? nullptr : ops_.back(); }

    std::vector<pipeline::OperationKind> kinds() const {
        std::vector<pipeline::OperationKind> result;
        for (const auto& op : ops_) {
            result.push_back(op->kind());
        }
        return result;
    }

    int shutdownCount() const { return shutdowns_; }

    /// Raise an event from this stage; call on the pipeline thread
    void emit(const pipeline::EventPtr& event) { sendEventUp(event); }

protected:
    void runOp(const pipeline::OperationPtr& op) override {
        ops_.push_back(op);
        for (auto kind : throwing_) {
            if (kind == op->kind()) {
                throw std::runtime_error("RecordingStage refused " + op->name());
            }
        }
        auto failure = failures_.find(op->kind());
        if (failure != failures_.end()) {
            op->complete(failure->second);
        } else if (autoComplete_) {
            op->complete();
        }
    }

    void onShutdown(const pipeline::Error& reason) override {
        ++shutdowns_;
        for (const auto& op : ops_) {
            if (!op->isCompleted()) {
                op->complete(reason);
            }
        }
    }

private:
    bool autoComplete_ = true;
    std::map<pipeline::OperationKind, pipeline::Error> failures_;
    std::vector<pipeline::OperationKind> throwing_;
    std::vector<pipeline::OperationPtr> ops_;
    int shutdowns_ = 0;
};

/// Pass-through stage that records the order in which operations cross it
class PassThroughStage : public pipeline::Stage {
public:
    explicit PassThroughStage(std::string name = "PassThroughStage") : Stage(std::move(name)) {}

    const std::vector<pipeline::OperationPtr>& ops() const { return ops_; }
    const std::vector<pipeline::EventPtr>& events() const { return events_; }

protected:
    void runOp(const pipeline::OperationPtr& op) override {
        ops_.push_back(op);
        passOpToNextStage(op);
    }

    void onEvent(const pipeline::EventPtr& event) override {
        events_.push_back(event);
        sendEventUp(event);
    }

private:
    std::vector<pipeline::OperationPtr> ops_;
    std::vector<pipeline::EventPtr> events_;
};

/// Captures what a completion callback saw
struct CompletionRecorder {
    int calls = 0;
    std::optional<pipeline::Error> error;

    pipeline::OperationCallback callback() {
        return [this](pipeline::Operation&, const std::optional<pipeline::Error>& e) {
            ++calls;
            error = e;
        };
    }

    bool succeeded() const { return calls == 1 && !error; }
    bool failedWith(pipeline::ErrorCode code) const { return calls == 1 && error && error->code == code; }
};

class FakeSymmetricKeySecurityClient : public ports::ISymmetricKeySecurityClient {
public:
    FakeSymmetricKeySecurityClient(std::string host, std::string registrationId, std::string idScope, std::string token)
        : host_(std::move(host)), registrationId_(std::move(registrationId)),
          idScope_(std::move(idScope)), token_(std::move(token)) {}

    std::string provisioningHost() const override { return host_; }
    std::string registrationId() const override { return registrationId_; }
    std::string idScope() const override { return idScope_; }
    std::string getCurrentSasToken() override {
        ++tokenRequests;
        return token_;
    }

    int tokenRequests = 0;

private:
    std::string host_;
    std::string registrationId_;
    std::string idScope_;
    std::string token_;
};

class FakeX509SecurityClient : public ports::IX509SecurityClient {
public:
    FakeX509SecurityClient(std::string host, std::string registrationId, std::string idScope, X509Certificate cert)
        : host_(std::move(host)), registrationId_(std::move(registrationId)),
          idScope_(std::move(idScope)), cert_(std::move(cert)) {}

    std::string provisioningHost() const override { return host_; }
    std::string registrationId() const override { return registrationId_; }
    std::string idScope() const override { return idScope_; }
    X509Certificate getX509Certificate() const override { return cert_; }

private:
    std::string host_;
    std::string registrationId_;
    std::string idScope_;
    X509Certificate cert_;
};

class FakeAuthenticationProvider : public ports::IAuthenticationProvider {
public:
    FakeAuthenticationProvider(std::string host, std::string deviceId, std::string moduleId, std::string token)
        : host_(std::move(host)), deviceId_(std::move(deviceId)),
          moduleId_(std::move(moduleId)), token_(std::move(token)) {}

    std::string hostname() const override { return host_; }
    std::string deviceId() const override { return deviceId_; }
    std::string moduleId() const override { return moduleId_; }
    std::string getCurrentSasToken() override { return token_; }

    void setToken(std::string token) { token_ = std::move(token); }

private:
    std::string host_;
    std::string deviceId_;
    std::string moduleId_;
    std::string token_;
};

/// Wall clock frozen at a settable epoch second
class FakeClock : public IClock {
public:
    explicit FakeClock(uint64_t epochSeconds) : epoch_(epochSeconds) {}

    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_));
    }
    uint64_t epochSeconds() const override { return epoch_; }
    std::string iso8601() const override { return "2023-11-14T22:13:20Z"; }

    void advance(std::chrono::seconds by) { epoch_ += static_cast<uint64_t>(by.count()); }

private:
    uint64_t epoch_;
};

/// Blob uploader whose uploads finish when the test says so, from any thread
class FakeBlobUploader : public ports::IBlobUploader {
public:
    struct Upload {
        std::string name;
        std::string content;
        Completion done;
    };

    void upload(const std::string& name, const std::string& content, Completion done) override {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.push_back(Upload{name, content, std::move(done)});
    }

    std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.size();
    }

    Upload at(std::size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.at(index);
    }

    void finish(std::size_t index, std::optional<pipeline::Error> error = std::nullopt) {
        Completion done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done = uploads_.at(index).done;
        }
        done(error);
    }

private:
    mutable std::mutex mutex_;
    std::vector<Upload> uploads_;
};

/// Run fn as a task on the executor and drain the queue
inline void runOnExecutor(sim::ManualExecutor& executor, std::function<void()> fn) {
    executor.post(std::move(fn));
    executor.runUntilIdle();
}

/**
 * @brief Pipeline of the stages under test followed by a RecordingStage
 *
 * Driven by a ManualExecutor; events leaving the head are collected.
 */
class StageHarness {
public:
    explicit StageHarness(std::vector<std::unique_ptr<pipeline::Stage>> stages)
        : executor(std::make_shared<sim::ManualExecutor>()) {
        auto recording = std::make_unique<RecordingStage>();
        tail = recording.get();
        stages.push_back(std::move(recording));
        pipeline = std::make_unique<pipeline::Pipeline>(executor, std::move(stages));
        pipeline->registerEventSink([this](const pipeline::EventPtr& event) { events.push_back(event); });
    }

    ~StageHarness() { pipeline->shutdown(); }

    pipeline::OperationPtr submit(pipeline::ops::Payload payload, CompletionRecorder& recorder) {
        auto op = pipeline->submit(std::move(payload), recorder.callback());
        executor->runUntilIdle();
        return op;
    }

    void raise(const pipeline::EventPtr& event) {
        runOnExecutor(*executor, [this, event] { tail->emit(event); });
    }

    std::shared_ptr<sim::ManualExecutor> executor;
    RecordingStage* tail = nullptr;
    std::unique_ptr<pipeline::Pipeline> pipeline;
    std::vector<pipeline::EventPtr> events;
};

template <class StageT, class... Args>
std::vector<std::unique_ptr<pipeline::Stage>> stagesOf(std::unique_ptr<StageT> first, Args&&... rest) {
    std::vector<std::unique_ptr<pipeline::Stage>> stages;
    stages.push_back(std::move(first));
    (stages.push_back(std::forward<Args>(rest)), ...);
    return stages;
}

} // namespace iotpipe::test
