#include <gtest/gtest.h>
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/stages/ConnectionStage.hpp"
#include "../core/stages/RetryStage.hpp"
#include "TestSupport.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace iotpipe;
using namespace iotpipe::pipeline;
using namespace std::chrono_literals;

class RetryStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        build(std::make_shared<adapters::ExponentialBackoffRetryPolicy>(1000ms, 2.0, std::chrono::minutes(5), 3));
    }

    void build(std::shared_ptr<ports::RetryPolicy> policy) {
        harness_.reset();
        auto retry = std::make_unique<stages::RetryStage>(std::move(policy));
        retry_ = retry.get();
        harness_ = std::make_unique<test::StageHarness>(test::stagesOf(std::move(retry)));
        harness_->tail->setAutoComplete(false);
    }

    void failAttempt(std::size_t index, Error error) {
        test::runOnExecutor(*harness_->executor, [this, index, error] {
            harness_->tail->ops().at(index)->complete(error);
        });
    }

    std::unique_ptr<test::StageHarness> harness_;
    stages::RetryStage* retry_ = nullptr;
};

TEST_F(RetryStageTest, RetriesAfterBackoffAndCopiesResult) {
    test::CompletionRecorder recorder;
    auto original = harness_->submit(ops::GetTwin{}, recorder);
    ASSERT_EQ(harness_->tail->ops().size(), 1u);
    EXPECT_NE(harness_->tail->ops()[0], original);

    failAttempt(0, Error::transport("dropped"));
    EXPECT_EQ(retry_->waitingCount(), 1u);

    harness_->executor->advance(999ms);
    EXPECT_EQ(harness_->tail->ops().size(), 1u);
    harness_->executor->advance(1ms);
    ASSERT_EQ(harness_->tail->ops().size(), 2u);

    test::runOnExecutor(*harness_->executor, [this] {
        auto attempt = harness_->tail->ops()[1];
        attempt->as<ops::GetTwin>().twin = nlohmann::json{{"desired", {{"$version", 3}}}};
        attempt->complete();
    });

    EXPECT_TRUE(recorder.succeeded());
    EXPECT_EQ(original->as<ops::GetTwin>().twin["desired"]["$version"], 3);
}

TEST_F(RetryStageTest, BackoffGrowsExponentially) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::SendTelemetry{}, recorder);

    failAttempt(0, Error::transport("dropped"));
    EXPECT_EQ(harness_->executor->nextTimerDelay(), 1000ms);
    harness_->executor->advance(1000ms);

    failAttempt(1, Error::transport("dropped"));
    EXPECT_EQ(harness_->executor->nextTimerDelay(), 2000ms);
}

TEST_F(RetryStageTest, ServiceRetryAfterLengthensDelay) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::RegisterDevice{}, recorder);

    Error throttled = Error::service("throttled", true);
    throttled.retryAfter = 5000ms;
    failAttempt(0, throttled);

    EXPECT_EQ(harness_->executor->nextTimerDelay(), 5000ms);
    harness_->executor->advance(4999ms);
    EXPECT_EQ(harness_->tail->ops().size(), 1u);
    harness_->executor->advance(1ms);
    EXPECT_EQ(harness_->tail->ops().size(), 2u);
}

TEST_F(RetryStageTest, NonRetryableErrorCompletesAtOnce) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::GetTwin{}, recorder);

    failAttempt(0, Error::service("forbidden", false));
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Service));
    EXPECT_EQ(harness_->executor->pendingTimers(), 0u);
}

TEST_F(RetryStageTest, GivesUpWhenAttemptsAreExhausted) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::GetTwin{}, recorder);

    failAttempt(0, Error::transport("one"));
    harness_->executor->advance(1000ms);
    failAttempt(1, Error::transport("two"));
    harness_->executor->advance(2000ms);
    failAttempt(2, Error::transport("three"));

    EXPECT_EQ(harness_->tail->ops().size(), 3u);
    ASSERT_TRUE(recorder.failedWith(ErrorCode::Transport));
    EXPECT_EQ(recorder.error->message, "three");
}

TEST_F(RetryStageTest, NoRetryPolicyFailsFirstAttempt) {
    build(std::make_shared<adapters::NoRetryPolicy>());
    test::CompletionRecorder recorder;
    harness_->submit(ops::GetTwin{}, recorder);

    failAttempt(0, Error::transport("dropped"));
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Transport));
}

TEST_F(RetryStageTest, ConnectionOperationsAreNotWrapped) {
    test::CompletionRecorder recorder;
    auto original = harness_->submit(ops::Connect{}, recorder);
    ASSERT_EQ(harness_->tail->ops().size(), 1u);
    EXPECT_EQ(harness_->tail->ops()[0], original);
}

TEST_F(RetryStageTest, ShutdownFailsWaitingOperations) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::GetTwin{}, recorder);
    failAttempt(0, Error::transport("dropped"));

    harness_->pipeline->shutdown();
    EXPECT_TRUE(recorder.failedWith(ErrorCode::ShuttingDown));
    EXPECT_EQ(retry_->waitingCount(), 0u);
}

TEST(RetryPolicyTest, ExponentialBackoffIsCapped) {
    adapters::ExponentialBackoffRetryPolicy policy(1000ms, 2.0, 5000ms, 10);
    EXPECT_EQ(policy.getBackoffDelay(1), 1000ms);
    EXPECT_EQ(policy.getBackoffDelay(2), 2000ms);
    EXPECT_EQ(policy.getBackoffDelay(3), 4000ms);
    EXPECT_EQ(policy.getBackoffDelay(4), 5000ms);
    EXPECT_TRUE(policy.shouldRetry(9));
    EXPECT_FALSE(policy.shouldRetry(10));
}

class ConnectionStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stage = std::make_unique<stages::ConnectionStage>();
        connection_ = stage.get();
        harness_ = std::make_unique<test::StageHarness>(test::stagesOf(std::move(stage)));
    }

    std::unique_ptr<test::StageHarness> harness_;
    stages::ConnectionStage* connection_ = nullptr;
};

TEST_F(ConnectionStageTest, ConnectsBeforeOperationThatNeedsIt) {
    test::CompletionRecorder recorder;
    harness_->submit(ops::SendTelemetry{}, recorder);

    const std::vector<OperationKind> expected{OperationKind::Connect, OperationKind::SendTelemetry};
    EXPECT_EQ(harness_->tail->kinds(), expected);
    EXPECT_TRUE(harness_->pipeline->isConnected());
    EXPECT_TRUE(recorder.succeeded());
}

TEST_F(ConnectionStageTest, RedundantConnectAndDisconnectCompleteLocally) {
    test::CompletionRecorder disconnected;
    harness_->submit(ops::Disconnect{}, disconnected);
    EXPECT_TRUE(disconnected.succeeded());
    EXPECT_TRUE(harness_->tail->ops().empty());

    test::CompletionRecorder first, second;
    harness_->submit(ops::Connect{}, first);
    harness_->submit(ops::Connect{}, second);
    EXPECT_TRUE(first.succeeded());
    EXPECT_TRUE(second.succeeded());
    EXPECT_EQ(harness_->tail->ops().size(), 1u);
}

TEST_F(ConnectionStageTest, OperationsWaitWhileConnecting) {
    harness_->tail->setAutoComplete(false);
    test::CompletionRecorder connect, twin, args;
    harness_->submit(ops::Connect{}, connect);
    harness_->submit(ops::GetTwin{}, twin);
    ops::SetCredentialToken token{"tok"};
    harness_->submit(token, args);

    EXPECT_TRUE(connection_->isConnectionInFlight());
    EXPECT_EQ(connection_->waitingCount(), 2u);
    ASSERT_EQ(harness_->tail->ops().size(), 1u);

    test::runOnExecutor(*harness_->executor, [this] { harness_->tail->ops()[0]->complete(); });

    EXPECT_TRUE(connect.succeeded());
    const std::vector<OperationKind> expected{
        OperationKind::Connect, OperationKind::GetTwin, OperationKind::SetCredentialToken};
    EXPECT_EQ(harness_->tail->kinds(), expected);
}

TEST_F(ConnectionStageTest, FailedAutoConnectFailsWaitingOperations) {
    harness_->tail->failKind(OperationKind::Connect, Error::transport("unreachable"));
    test::CompletionRecorder recorder;
    harness_->submit(ops::GetTwin{}, recorder);

    ASSERT_TRUE(recorder.failedWith(ErrorCode::Transport));
    EXPECT_EQ(recorder.error->message, "unreachable");
    EXPECT_FALSE(harness_->pipeline->isConnected());
}

TEST_F(ConnectionStageTest, ConnectionEventsUpdateState) {
    harness_->raise(makeEvent(events::ConnectionStateChanged{true, ""}));
    EXPECT_TRUE(harness_->pipeline->isConnected());

    harness_->raise(makeEvent(events::ConnectionStateChanged{false, "keep-alive timeout"}));
    EXPECT_FALSE(harness_->pipeline->isConnected());
    EXPECT_EQ(harness_->events.size(), 2u);
}

TEST_F(ConnectionStageTest, ShutdownFailsWaitingOperations) {
    harness_->tail->setAutoComplete(false);
    test::CompletionRecorder connect, twin;
    harness_->submit(ops::Connect{}, connect);
    harness_->submit(ops::GetTwin{}, twin);

    harness_->pipeline->shutdown();
    EXPECT_TRUE(connect.failedWith(ErrorCode::ShuttingDown));
    EXPECT_TRUE(twin.failedWith(ErrorCode::ShuttingDown));
}

TEST_F(ConnectionStageTest, ThrowingCallbackDoesNotStrandWaitingOperations) {
    std::vector<std::string> reported;
    harness_->pipeline->setBackgroundErrorHandler([&reported](std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            reported.push_back(e.what());
        }
    });

    harness_->tail->setAutoComplete(false);
    harness_->pipeline->submit(ops::GetTwin{}, [](Operation&, const std::optional<Error>&) {
        throw std::runtime_error("caller callback failed");
    });
    test::CompletionRecorder telemetry, token;
    harness_->submit(ops::SendTelemetry{}, telemetry);
    harness_->submit(ops::SetCredentialToken{"tok"}, token);
    ASSERT_EQ(connection_->waitingCount(), 3u);

    test::runOnExecutor(*harness_->executor, [this] {
        harness_->tail->ops()[0]->complete(Error::transport("unreachable"));
    });

    EXPECT_EQ(reported, (std::vector<std::string>{"caller callback failed"}));
    EXPECT_TRUE(telemetry.failedWith(ErrorCode::Transport));
    EXPECT_EQ(connection_->waitingCount(), 0u);
    ASSERT_EQ(harness_->tail->ops().size(), 2u);
    EXPECT_EQ(harness_->tail->ops()[1]->kind(), OperationKind::SetCredentialToken);
    EXPECT_EQ(harness_->pipeline->pendingOperations(), 1u);
}
