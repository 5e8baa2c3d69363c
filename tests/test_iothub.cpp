#include <gtest/gtest.h>
#include "../core/DeviceClient.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace iotpipe;
using namespace iotpipe::pipeline;
using namespace std::chrono_literals;

namespace {

struct Outcome {
    int calls = 0;
    std::optional<Error> error;

    DeviceClient::Completion callback() {
        return [this](const std::optional<Error>& e) {
            ++calls;
            error = e;
        };
    }

    bool succeeded() const { return calls == 1 && !error; }
};

std::size_t countOf(const std::vector<std::string>& topics, const std::string& topic) {
    return static_cast<std::size_t>(std::count(topics.begin(), topics.end(), topic));
}

} // namespace

class DeviceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<sim::ManualExecutor>();
        mqtt_ = std::make_shared<sim::MockMqttClient>();
        auth_ = std::make_shared<test::FakeAuthenticationProvider>("contoso.azure-devices.net", "dev1", "", "tok-1");
        uploader_ = std::make_shared<test::FakeBlobUploader>();
        options_.blobUploader = uploader_;
    }

    void build() {
        client_ = std::make_unique<DeviceClient>(auth_, mqtt_, executor_, options_);
        executor_->runUntilIdle();
    }

    void connect() {
        Outcome outcome;
        client_->connect(outcome.callback());
        executor_->runUntilIdle();
        ASSERT_TRUE(outcome.succeeded());
    }

    void deliver(const std::string& topic, const std::string& payload) {
        mqtt_->injectMessage(topic, payload);
        executor_->runUntilIdle();
    }

    std::shared_ptr<sim::ManualExecutor> executor_;
    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::shared_ptr<test::FakeAuthenticationProvider> auth_;
    std::shared_ptr<test::FakeBlobUploader> uploader_;
    PipelineOptions options_;
    std::unique_ptr<DeviceClient> client_;
};

TEST_F(DeviceClientTest, ConnectsWithHubUsernameAndToken) {
    build();
    connect();

    ASSERT_EQ(mqtt_->connects().size(), 1u);
    const auto& record = mqtt_->connects().front();
    EXPECT_EQ(record.host, "contoso.azure-devices.net");
    EXPECT_EQ(record.clientId, "dev1");
    EXPECT_EQ(record.username, "contoso.azure-devices.net/dev1/?api-version=2021-04-12");
    EXPECT_EQ(record.password, "tok-1");
    EXPECT_TRUE(client_->isConnected());
    EXPECT_EQ(client_->deviceId(), "dev1");
}

TEST_F(DeviceClientTest, ModuleIdentityUsesModuleClientId) {
    auth_ = std::make_shared<test::FakeAuthenticationProvider>("contoso.azure-devices.net", "dev1", "filter", "tok-1");
    build();

    Outcome outcome;
    client_->sendTelemetry(Message{}, outcome.callback());
    executor_->runUntilIdle();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(mqtt_->connects().front().clientId, "dev1/filter");
    EXPECT_EQ(mqtt_->publishedMessages().front().topic.rfind("devices/dev1/modules/filter/messages/events/", 0), 0u);
}

TEST_F(DeviceClientTest, TelemetryConnectsOnDemandAndEncodesProperties) {
    build();

    Message message;
    message.payload = R"({"temperature":21.5})";
    message.messageId = "dev1-1";
    message.customProperties["temp alert"] = "high";

    Outcome outcome;
    client_->sendTelemetry(message, outcome.callback());
    executor_->runUntilIdle();

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(mqtt_->connects().size(), 1u);
    ASSERT_EQ(mqtt_->publishedMessages().size(), 1u);
    const auto& published = mqtt_->publishedMessages().front();
    EXPECT_EQ(published.topic,
              "devices/dev1/messages/events/$.mid=dev1-1&$.ct=application%2Fjson&$.ce=utf-8&temp%20alert=high");
    EXPECT_EQ(published.payload, R"({"temperature":21.5})");
    EXPECT_EQ(published.qos, 1);
}

TEST_F(DeviceClientTest, RejectedPublishIsRetried) {
    build();
    connect();
    mqtt_->setRejectRequests(true);

    Outcome outcome;
    client_->sendTelemetry(Message{}, outcome.callback());
    executor_->runUntilIdle();
    EXPECT_EQ(outcome.calls, 0);

    mqtt_->setRejectRequests(false);
    executor_->advance(1000ms);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(mqtt_->publishedMessages().size(), 1u);
}

TEST_F(DeviceClientTest, DirectMethodRoundTrip) {
    build();
    std::vector<MethodRequest> requests;
    client_->setMethodRequestHandler([&requests](const MethodRequest& request) { requests.push_back(request); });

    Outcome enabled;
    client_->enableMethods(enabled.callback());
    executor_->runUntilIdle();
    ASSERT_TRUE(enabled.succeeded());
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/methods/POST/#"), 1u);

    deliver("$iothub/methods/POST/reboot/?$rid=7", R"({"delay":5})");
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].name, "reboot");
    EXPECT_EQ(requests[0].requestId, "7");
    EXPECT_EQ(requests[0].payload["delay"], 5);

    Outcome responded;
    client_->sendMethodResponse(MethodResponse{"7", 200, nlohmann::json{{"result", "ok"}}}, responded.callback());
    executor_->runUntilIdle();

    ASSERT_TRUE(responded.succeeded());
    const auto& published = mqtt_->publishedMessages().back();
    EXPECT_EQ(published.topic, "$iothub/methods/res/200/?$rid=7");
    EXPECT_EQ(nlohmann::json::parse(published.payload), nlohmann::json({{"result", "ok"}}));
}

TEST_F(DeviceClientTest, EnablingTwiceSubscribesOnce) {
    build();
    Outcome first, second;
    client_->enableMethods(first.callback());
    client_->enableMethods(second.callback());
    executor_->runUntilIdle();

    EXPECT_TRUE(first.succeeded());
    EXPECT_TRUE(second.succeeded());
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/methods/POST/#"), 1u);
}

TEST_F(DeviceClientTest, GetTwinSubscribesThenRequests) {
    build();

    int calls = 0;
    std::optional<Error> error;
    nlohmann::json twin;
    client_->getTwin([&](const std::optional<Error>& e, const nlohmann::json& t) {
        ++calls;
        error = e;
        twin = t;
    });
    executor_->runUntilIdle();

    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/twin/res/#"), 1u);
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/twin/PATCH/properties/desired/#"), 1u);
    ASSERT_EQ(mqtt_->publishedMessages().size(), 1u);
    EXPECT_EQ(mqtt_->publishedMessages()[0].topic, "$iothub/twin/GET/?$rid=1");

    deliver("$iothub/twin/res/200/?$rid=1",
            R"({"desired":{"interval":30,"$version":4},"reported":{"firmware":"1.0","$version":2}})");

    ASSERT_EQ(calls, 1);
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(twin["desired"]["interval"], 30);
    EXPECT_EQ(twin["reported"]["firmware"], "1.0");
}

TEST_F(DeviceClientTest, ReportedPropertiesReturnVersion) {
    build();

    int version = 0;
    int calls = 0;
    client_->patchReportedProperties(nlohmann::json{{"firmware", "1.1"}},
        [&](const std::optional<Error>& e, int v) {
            ++calls;
            EXPECT_FALSE(e.has_value());
            version = v;
        });
    executor_->runUntilIdle();

    const auto& published = mqtt_->publishedMessages().back();
    EXPECT_EQ(published.topic, "$iothub/twin/PATCH/properties/reported/?$rid=1");
    EXPECT_EQ(nlohmann::json::parse(published.payload), nlohmann::json({{"firmware", "1.1"}}));

    deliver("$iothub/twin/res/204/?$rid=1&$version=5", "");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(version, 5);
}

TEST_F(DeviceClientTest, TwinErrorStatusFailsRequest) {
    build();

    std::optional<Error> error;
    client_->getTwin([&](const std::optional<Error>& e, const nlohmann::json&) { error = e; });
    executor_->runUntilIdle();

    deliver("$iothub/twin/res/404/?$rid=1", R"({"message":"Twin not found"})");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::Service);
    EXPECT_NE(error->message.find("Twin not found"), std::string::npos);
}

TEST_F(DeviceClientTest, TwinRequestIsRetriedAfterConnectionLoss) {
    build();

    int calls = 0;
    client_->getTwin([&](const std::optional<Error>& e, const nlohmann::json&) {
        ++calls;
        EXPECT_FALSE(e.has_value());
    });
    executor_->runUntilIdle();

    mqtt_->simulateConnectionLoss("network down");
    executor_->runUntilIdle();
    EXPECT_EQ(calls, 0);

    executor_->advance(1000ms);
    EXPECT_EQ(mqtt_->connects().size(), 2u);
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/twin/res/#"), 2u);
    EXPECT_EQ(mqtt_->publishedMessages().back().topic, "$iothub/twin/GET/?$rid=2");

    deliver("$iothub/twin/res/200/?$rid=2", R"({"desired":{},"reported":{}})");
    EXPECT_EQ(calls, 1);
}

TEST_F(DeviceClientTest, DesiredPropertyPatchReachesHandler) {
    build();
    nlohmann::json patch;
    int version = 0;
    client_->setTwinPatchHandler([&](const nlohmann::json& p, int v) {
        patch = p;
        version = v;
    });

    Outcome enabled;
    client_->enableTwinPatches(enabled.callback());
    executor_->runUntilIdle();
    ASSERT_TRUE(enabled.succeeded());

    deliver("$iothub/twin/PATCH/properties/desired/?$version=12", R"({"interval":60,"$version":12})");
    EXPECT_EQ(version, 12);
    EXPECT_EQ(patch["interval"], 60);
}

TEST_F(DeviceClientTest, CloudToDeviceMessageCarriesProperties) {
    build();
    std::vector<Message> received;
    client_->setC2DMessageHandler([&received](const Message& m) { received.push_back(m); });

    Outcome enabled;
    client_->enableC2D(enabled.callback());
    executor_->runUntilIdle();
    ASSERT_TRUE(enabled.succeeded());
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "devices/dev1/messages/devicebound/#"), 1u);

    deliver("devices/dev1/messages/devicebound/%24.mid=abc&%24.to=%2Fdevices%2Fdev1%2Fmessages%2Fdevicebound"
            "&%24.ct=text%2Fplain&color=red",
            "turn on");

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].payload, "turn on");
    EXPECT_EQ(received[0].messageId, "abc");
    EXPECT_EQ(received[0].contentType, "text/plain");
    ASSERT_EQ(received[0].customProperties.size(), 1u);
    EXPECT_EQ(received[0].customProperties.at("color"), "red");
}

TEST_F(DeviceClientTest, SubscriptionsAreRestoredAfterReconnect) {
    build();
    Outcome methods, c2d;
    client_->enableMethods(methods.callback());
    client_->enableC2D(c2d.callback());
    executor_->runUntilIdle();
    ASSERT_TRUE(methods.succeeded());
    ASSERT_TRUE(c2d.succeeded());

    mqtt_->simulateConnectionLoss("keep-alive timeout");
    executor_->runUntilIdle();
    EXPECT_FALSE(client_->isConnected());

    connect();
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "$iothub/methods/POST/#"), 2u);
    EXPECT_EQ(countOf(mqtt_->subscriptions(), "devices/dev1/messages/devicebound/#"), 2u);
}

TEST_F(DeviceClientTest, ConnectionStateHandlerSeesChanges) {
    build();
    std::vector<bool> states;
    client_->setConnectionStateHandler([&states](bool connected, const std::string&) { states.push_back(connected); });

    connect();
    mqtt_->simulateConnectionLoss();
    executor_->runUntilIdle();

    const std::vector<bool> expected{true, false};
    EXPECT_EQ(states, expected);
}

TEST_F(DeviceClientTest, DisconnectClosesTransport) {
    build();
    connect();

    Outcome outcome;
    client_->disconnect(outcome.callback());
    executor_->runUntilIdle();

    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(mqtt_->disconnectCount(), 1u);
    EXPECT_FALSE(client_->isConnected());
}

TEST_F(DeviceClientTest, RenewedTokenIsUsedForNextConnect) {
    build();
    connect();

    auth_->setToken("tok-2");
    Outcome renewed;
    client_->renewToken(renewed.callback());
    executor_->runUntilIdle();
    ASSERT_TRUE(renewed.succeeded());

    Outcome disconnected;
    client_->disconnect(disconnected.callback());
    executor_->runUntilIdle();
    connect();

    ASSERT_EQ(mqtt_->connects().size(), 2u);
    EXPECT_EQ(mqtt_->connects().back().password, "tok-2");
}

TEST_F(DeviceClientTest, BlobUploadCompletesFromUploaderThread) {
    build();

    Outcome outcome;
    client_->uploadBlob("logs/today.txt", "line one", outcome.callback());
    executor_->runUntilIdle();

    ASSERT_EQ(uploader_->count(), 1u);
    EXPECT_EQ(uploader_->at(0).name, "logs/today.txt");
    EXPECT_EQ(uploader_->at(0).content, "line one");
    EXPECT_EQ(outcome.calls, 0);
    EXPECT_TRUE(mqtt_->connects().empty());

    uploader_->finish(0);
    EXPECT_EQ(outcome.calls, 0);
    executor_->runUntilIdle();
    EXPECT_TRUE(outcome.succeeded());
}

TEST_F(DeviceClientTest, BlobUploadWithoutUploaderIsConfigurationError) {
    options_.blobUploader.reset();
    build();

    Outcome outcome;
    client_->uploadBlob("a.txt", "x", outcome.callback());
    executor_->runUntilIdle();

    ASSERT_EQ(outcome.calls, 1);
    EXPECT_EQ(outcome.error->code, ErrorCode::Configuration);
}

TEST_F(DeviceClientTest, ShutdownFailsOutstandingTwinRequest) {
    build();
    std::optional<Error> error;
    client_->getTwin([&](const std::optional<Error>& e, const nlohmann::json&) { error = e; });
    executor_->runUntilIdle();

    client_->shutdown();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::ShuttingDown);

    Outcome late;
    client_->sendTelemetry(Message{}, late.callback());
    ASSERT_EQ(late.calls, 1);
    EXPECT_EQ(late.error->code, ErrorCode::ShuttingDown);
}

TEST(DeviceClientConstructionTest, RejectsNullProvider) {
    auto executor = std::make_shared<sim::ManualExecutor>();
    auto mqtt = std::make_shared<sim::MockMqttClient>();
    EXPECT_THROW(DeviceClient(nullptr, mqtt, executor), std::invalid_argument);
}
