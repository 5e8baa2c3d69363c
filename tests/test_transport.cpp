#include <gtest/gtest.h>
#include "../core/pipeline/Pipeline.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/stages/MqttTransportStage.hpp"
#include "TestSupport.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

using namespace iotpipe;
using namespace iotpipe::pipeline;

class MqttTransportStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<sim::ManualExecutor>();
        mqtt_ = std::make_shared<sim::MockMqttClient>();

        stages::MqttTransportStage::Options options;
        options.port = 8883;
        options.tls.caPath = "roots.pem";
        std::vector<std::unique_ptr<Stage>> chain;
        chain.push_back(std::make_unique<stages::MqttTransportStage>(mqtt_, options));
        pipeline_ = std::make_unique<Pipeline>(executor_, std::move(chain));
        pipeline_->registerEventSink([this](const EventPtr& event) { events_.push_back(event); });
    }

    void TearDown() override {
        pipeline_.reset();
    }

    OperationPtr run(ops::Payload payload, test::CompletionRecorder& recorder) {
        auto op = pipeline_->submit(std::move(payload), recorder.callback());
        executor_->runUntilIdle();
        return op;
    }

    void setArgs(std::optional<std::string> token = std::string("tok")) {
        ops::SetMqttConnectionArgs args;
        args.host = "contoso.azure-devices.net";
        args.clientId = "dev1";
        args.username = "contoso.azure-devices.net/dev1/?api-version=2021-04-12";
        args.sasToken = std::move(token);
        test::CompletionRecorder recorder;
        run(args, recorder);
        ASSERT_TRUE(recorder.succeeded());
    }

    void connect() {
        test::CompletionRecorder recorder;
        run(ops::Connect{}, recorder);
        ASSERT_TRUE(recorder.succeeded());
    }

    std::shared_ptr<sim::ManualExecutor> executor_;
    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::unique_ptr<Pipeline> pipeline_;
    std::vector<EventPtr> events_;
};

TEST_F(MqttTransportStageTest, InstallsClientCallbacksOnAttach) {
    EXPECT_TRUE(mqtt_->hasConnectionCallback());
    EXPECT_TRUE(mqtt_->hasMessageCallback());

    pipeline_.reset();
    EXPECT_FALSE(mqtt_->hasConnectionCallback());
    EXPECT_FALSE(mqtt_->hasMessageCallback());
}

TEST_F(MqttTransportStageTest, ConnectBeforeArgumentsIsConfigurationError) {
    test::CompletionRecorder recorder;
    run(ops::Connect{}, recorder);
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Configuration));
    EXPECT_TRUE(mqtt_->connects().empty());
}

TEST_F(MqttTransportStageTest, CredentialBeforeArgumentsIsConfigurationError) {
    test::CompletionRecorder token, cert;
    run(ops::SetCredentialToken{"tok"}, token);
    run(ops::SetClientCertificate{X509Certificate{"c.pem", "k.pem", ""}}, cert);
    EXPECT_TRUE(token.failedWith(ErrorCode::Configuration));
    EXPECT_TRUE(cert.failedWith(ErrorCode::Configuration));
}

TEST_F(MqttTransportStageTest, ConnectsWithTokenAsPassword) {
    setArgs();
    connect();

    ASSERT_EQ(mqtt_->connects().size(), 1u);
    const auto& record = mqtt_->connects().front();
    EXPECT_EQ(record.host, "contoso.azure-devices.net");
    EXPECT_EQ(record.port, 8883);
    EXPECT_EQ(record.password, "tok");
    EXPECT_FALSE(record.withCertificate);
    EXPECT_EQ(record.tls.caPath, "roots.pem");
    EXPECT_TRUE(record.tls.certPath.empty());

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_TRUE(events_.front()->as<events::ConnectionStateChanged>().connected);
}

TEST_F(MqttTransportStageTest, CertificateReplacesToken) {
    setArgs();
    test::CompletionRecorder cert;
    run(ops::SetClientCertificate{X509Certificate{"dev1.pem", "dev1.key", "pw"}}, cert);
    ASSERT_TRUE(cert.succeeded());
    connect();

    const auto& record = mqtt_->connects().front();
    EXPECT_TRUE(record.withCertificate);
    EXPECT_EQ(record.tls.certPath, "dev1.pem");
    EXPECT_EQ(record.tls.keyPath, "dev1.key");
    EXPECT_EQ(record.tls.keyPassword, "pw");
    EXPECT_EQ(record.tls.caPath, "roots.pem");
}

TEST_F(MqttTransportStageTest, RefusedConnectFailsAtOnce) {
    setArgs();
    mqtt_->setRefuseConnect(true);

    test::CompletionRecorder recorder;
    run(ops::Connect{}, recorder);
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Transport));
}

TEST_F(MqttTransportStageTest, BrokerRejectionIsRetryableTransportError) {
    setArgs();
    mqtt_->setConnectFailureReason("Not authorized");

    test::CompletionRecorder recorder;
    run(ops::Connect{}, recorder);
    ASSERT_TRUE(recorder.failedWith(ErrorCode::Transport));
    EXPECT_TRUE(recorder.error->retryable);
    EXPECT_NE(recorder.error->message.find("Not authorized"), std::string::npos);
}

TEST_F(MqttTransportStageTest, ConnectCompletesOnlyWhenClientReports) {
    setArgs();
    mqtt_->setAutoConnect(false);

    test::CompletionRecorder first, second;
    run(ops::Connect{}, first);
    run(ops::Connect{}, second);
    EXPECT_EQ(first.calls, 0);
    EXPECT_TRUE(second.failedWith(ErrorCode::Unexpected));

    mqtt_->completeConnect(true);
    executor_->runUntilIdle();
    EXPECT_TRUE(first.succeeded());
}

TEST_F(MqttTransportStageTest, PublishWhileDisconnectedIsRetryable) {
    setArgs();
    test::CompletionRecorder recorder;
    run(ops::MqttPublish{"devices/dev1/messages/events/", "{}", 1}, recorder);
    ASSERT_TRUE(recorder.failedWith(ErrorCode::Transport));
    EXPECT_TRUE(recorder.error->retryable);
}

TEST_F(MqttTransportStageTest, RequestsCompleteOnAcknowledgement) {
    setArgs();
    connect();
    mqtt_->setAutoAck(false);

    test::CompletionRecorder publish, subscribe, unsubscribe;
    run(ops::MqttPublish{"a/b", "payload", 1}, publish);
    run(ops::MqttSubscribe{"c/#", 1}, subscribe);
    run(ops::MqttUnsubscribe{"c/#"}, unsubscribe);
    ASSERT_EQ(mqtt_->pendingRequests().size(), 3u);
    EXPECT_EQ(publish.calls, 0);

    mqtt_->completeNext(true);
    mqtt_->completeNext(false, "Subscription refused");
    mqtt_->completeNext(true);
    executor_->runUntilIdle();

    EXPECT_TRUE(publish.succeeded());
    ASSERT_TRUE(subscribe.failedWith(ErrorCode::Transport));
    EXPECT_NE(subscribe.error->message.find("Subscription refused"), std::string::npos);
    EXPECT_TRUE(unsubscribe.succeeded());
    EXPECT_EQ(mqtt_->unsubscriptions().front(), "c/#");
}

TEST_F(MqttTransportStageTest, ConnectionLossFailsInFlightRequests) {
    setArgs();
    connect();
    mqtt_->setAutoAck(false);

    test::CompletionRecorder publish;
    run(ops::MqttPublish{"a/b", "payload", 1}, publish);

    mqtt_->simulateConnectionLoss("socket closed");
    executor_->runUntilIdle();
    ASSERT_TRUE(publish.failedWith(ErrorCode::Transport));
    EXPECT_TRUE(publish.error->retryable);

    // A late acknowledgement for the failed request is ignored
    mqtt_->completeAll(true);
    executor_->runUntilIdle();
    EXPECT_EQ(publish.calls, 1);

    ASSERT_EQ(events_.size(), 2u);
    const auto& change = events_.back()->as<events::ConnectionStateChanged>();
    EXPECT_FALSE(change.connected);
    EXPECT_EQ(change.reason, "socket closed");
}

TEST_F(MqttTransportStageTest, InboundMessagesBecomeEvents) {
    setArgs();
    connect();
    events_.clear();

    mqtt_->injectMessage("custom/topic", "hello");
    EXPECT_TRUE(events_.empty());
    executor_->runUntilIdle();

    ASSERT_EQ(events_.size(), 1u);
    const auto& message = events_.front()->as<events::MessageReceived>().message;
    EXPECT_EQ(message.topic, "custom/topic");
    EXPECT_EQ(message.payload, "hello");
}

TEST_F(MqttTransportStageTest, DisconnectWaitsForClient) {
    setArgs();
    connect();

    test::CompletionRecorder recorder;
    run(ops::Disconnect{}, recorder);
    EXPECT_TRUE(recorder.succeeded());
    EXPECT_EQ(mqtt_->disconnectCount(), 1u);

    test::CompletionRecorder again;
    run(ops::Disconnect{}, again);
    EXPECT_TRUE(again.succeeded());
    EXPECT_EQ(mqtt_->disconnectCount(), 1u);
}

TEST_F(MqttTransportStageTest, UnknownOperationHasNoHandler) {
    test::CompletionRecorder recorder;
    run(ops::GetTwin{}, recorder);
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Configuration));
}

TEST_F(MqttTransportStageTest, ShutdownFailsPendingConnectAndDisconnects) {
    setArgs();
    mqtt_->setAutoConnect(false);

    test::CompletionRecorder recorder;
    run(ops::Connect{}, recorder);
    pipeline_->shutdown();
    EXPECT_TRUE(recorder.failedWith(ErrorCode::ShuttingDown));
}

TEST(MqttTransportStageConstructionTest, RejectsNullClient) {
    EXPECT_THROW(stages::MqttTransportStage(nullptr), std::invalid_argument);
}
