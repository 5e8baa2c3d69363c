#include <gtest/gtest.h>
#include "../core/adapters/SecurityClients.hpp"
#include "../core/stages/AuthProviderStage.hpp"
#include "../core/stages/SecurityClientStage.hpp"
#include "TestSupport.hpp"
#include <memory>
#include <stdexcept>

using namespace iotpipe;
using namespace iotpipe::pipeline;

class SecurityClientStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        harness_ = std::make_unique<test::StageHarness>(
            test::stagesOf(std::make_unique<stages::SecurityClientStage>()));
    }

    std::unique_ptr<test::StageHarness> harness_;
};

TEST_F(SecurityClientStageTest, SymmetricKeyClientBecomesConnectionArgsWithToken) {
    auto client = std::make_shared<test::FakeSymmetricKeySecurityClient>(
        "global.azure-devices-provisioning.net", "dev1", "0ne000ABC", "SharedAccessSignature sr=x");

    test::CompletionRecorder recorder;
    harness_->submit(ops::SetSymmetricKeySecurityClient{client}, recorder);

    ASSERT_EQ(harness_->tail->ops().size(), 1u);
    const auto& args = harness_->tail->last()->as<ops::SetConnectionArgs>();
    EXPECT_EQ(args.host, "global.azure-devices-provisioning.net");
    EXPECT_EQ(args.registrationId, "dev1");
    EXPECT_EQ(args.idScope, "0ne000ABC");
    EXPECT_EQ(args.sasToken, std::optional<std::string>("SharedAccessSignature sr=x"));
    EXPECT_FALSE(args.clientCertificate.has_value());
    EXPECT_EQ(client->tokenRequests, 1);
    EXPECT_TRUE(recorder.succeeded());
}

TEST_F(SecurityClientStageTest, X509ClientBecomesConnectionArgsWithCertificate) {
    auto client = std::make_shared<test::FakeX509SecurityClient>(
        "dps.example.net", "dev2", "0ne000ABC", X509Certificate{"dev2.pem", "dev2.key", "secret"});

    test::CompletionRecorder recorder;
    harness_->submit(ops::SetX509SecurityClient{client}, recorder);

    ASSERT_EQ(harness_->tail->ops().size(), 1u);
    const auto& args = harness_->tail->last()->as<ops::SetConnectionArgs>();
    EXPECT_EQ(args.host, "dps.example.net");
    EXPECT_EQ(args.registrationId, "dev2");
    EXPECT_EQ(args.idScope, "0ne000ABC");
    ASSERT_TRUE(args.clientCertificate.has_value());
    EXPECT_EQ(args.clientCertificate->certPath, "dev2.pem");
    EXPECT_EQ(args.clientCertificate->keyPath, "dev2.key");
    EXPECT_EQ(args.clientCertificate->passPhrase, "secret");
    EXPECT_FALSE(args.sasToken.has_value());
    EXPECT_TRUE(recorder.succeeded());
}

TEST_F(SecurityClientStageTest, DownstreamFailureCompletesSetOperation) {
    harness_->tail->failKind(OperationKind::SetConnectionArgs, Error::configuration("no transport"));
    auto client = std::make_shared<test::FakeSymmetricKeySecurityClient>("dps", "dev1", "scope", "tok");

    test::CompletionRecorder recorder;
    harness_->submit(ops::SetSymmetricKeySecurityClient{client}, recorder);
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Configuration));
}

TEST_F(SecurityClientStageTest, OtherOperationsPassThroughUnchanged) {
    Message message;
    message.payload = R"({"temperature":21.5})";
    message.messageId = "m-1";
    message.customProperties = {{"alert", "high"}, {"source", "sensor-7"}};

    test::CompletionRecorder recorder;
    auto op = harness_->submit(ops::SendTelemetry{message}, recorder);

    ASSERT_EQ(harness_->tail->ops().size(), 1u);
    EXPECT_EQ(harness_->tail->last(), op);
    const auto& sent = harness_->tail->last()->as<ops::SendTelemetry>().message;
    EXPECT_EQ(sent.payload, R"({"temperature":21.5})");
    EXPECT_EQ(sent.messageId, "m-1");
    EXPECT_EQ(sent.customProperties, message.customProperties);
    EXPECT_TRUE(recorder.succeeded());
}

class AuthProviderStageTest : public ::testing::Test {
protected:
    void SetUp() override {
        harness_ = std::make_unique<test::StageHarness>(
            test::stagesOf(std::make_unique<stages::AuthProviderStage>()));
    }

    std::unique_ptr<test::StageHarness> harness_;
};

TEST_F(AuthProviderStageTest, ProviderBecomesArgsThenToken) {
    auto provider = std::make_shared<test::FakeAuthenticationProvider>("hub.example.net", "dev1", "mod1", "tok-1");

    test::CompletionRecorder recorder;
    harness_->submit(ops::SetAuthenticationProvider{provider}, recorder);

    const std::vector<OperationKind> expected{OperationKind::SetConnectionArgs, OperationKind::SetCredentialToken};
    ASSERT_EQ(harness_->tail->kinds(), expected);

    const auto& args = harness_->tail->ops()[0]->as<ops::SetConnectionArgs>();
    EXPECT_EQ(args.host, "hub.example.net");
    EXPECT_EQ(args.deviceId, "dev1");
    EXPECT_EQ(args.moduleId, "mod1");
    EXPECT_FALSE(args.sasToken.has_value());
    EXPECT_EQ(harness_->tail->ops()[1]->as<ops::SetCredentialToken>().token, "tok-1");
    EXPECT_TRUE(recorder.succeeded());
}

TEST_F(AuthProviderStageTest, TokenIsNotSentWhenArgsFail) {
    harness_->tail->failKind(OperationKind::SetConnectionArgs, Error::configuration("rejected"));
    auto provider = std::make_shared<test::FakeAuthenticationProvider>("hub.example.net", "dev1", "", "tok-1");

    test::CompletionRecorder recorder;
    harness_->submit(ops::SetAuthenticationProvider{provider}, recorder);

    EXPECT_EQ(harness_->tail->ops().size(), 1u);
    EXPECT_TRUE(recorder.failedWith(ErrorCode::Configuration));
}

TEST(SecurityClientsTest, SymmetricKeyClientSignsRegistrationToken) {
    auto clock = std::make_shared<test::FakeClock>(1700000000 - 3600);
    adapters::SymmetricKeySecurityClient client("dps.example.net", "dev1", "0ne000ABC", "dGVzdGtleQ==", clock);

    EXPECT_EQ(client.provisioningHost(), "dps.example.net");
    const std::string token = client.getCurrentSasToken();
    EXPECT_EQ(token.find("SharedAccessSignature sr=0ne000ABC%2Fregistrations%2Fdev1&sig="), 0u);
    EXPECT_NE(token.find("&se=1700000000&skn=registration"), std::string::npos);
}

TEST(SecurityClientsTest, ConstructorsRejectMissingFields) {
    EXPECT_THROW(adapters::SymmetricKeySecurityClient("", "dev1", "scope", "dGVzdGtleQ=="), std::invalid_argument);
    EXPECT_THROW(adapters::SymmetricKeySecurityClient("dps", "dev1", "scope", ""), std::invalid_argument);
    EXPECT_THROW(adapters::X509SecurityClient("dps", "dev1", "scope", X509Certificate{"c.pem", "", ""}),
                 std::invalid_argument);
    EXPECT_THROW(adapters::SymmetricKeyAuthenticationProvider("hub", "", "", "dGVzdGtleQ=="), std::invalid_argument);
}

TEST(SecurityClientsTest, ConnectionStringParsing) {
    auto clock = std::make_shared<test::FakeClock>(1700000000 - 3600);
    auto provider = adapters::SymmetricKeyAuthenticationProvider::fromConnectionString(
        "HostName=MyHub.azure-devices.net;DeviceId=dev1;SharedAccessKey=dGVzdGtleQ==", clock);

    EXPECT_EQ(provider->hostname(), "MyHub.azure-devices.net");
    EXPECT_EQ(provider->deviceId(), "dev1");
    EXPECT_TRUE(provider->moduleId().empty());
    EXPECT_EQ(provider->getCurrentSasToken(),
              "SharedAccessSignature sr=myhub.azure-devices.net%2Fdevices%2Fdev1"
              "&sig=yr6vXIgRLpUEImJ8%2FRjwZcPma5cZp9wZrxoaI%2Bwjh9g%3D&se=1700000000");
}

TEST(SecurityClientsTest, ConnectionStringWithModule) {
    auto provider = adapters::SymmetricKeyAuthenticationProvider::fromConnectionString(
        "HostName=hub.example.net;DeviceId=dev1;ModuleId=mod1;SharedAccessKey=dGVzdGtleQ==");
    EXPECT_EQ(provider->moduleId(), "mod1");
}

TEST(SecurityClientsTest, ConnectionStringRejectsMissingOrMalformedParts) {
    using adapters::SymmetricKeyAuthenticationProvider;
    EXPECT_THROW(SymmetricKeyAuthenticationProvider::fromConnectionString("HostName=hub;DeviceId=dev1"),
                 std::invalid_argument);
    EXPECT_THROW(SymmetricKeyAuthenticationProvider::fromConnectionString(
                     "HostName=hub;garbage;DeviceId=dev1;SharedAccessKey=dGVzdGtleQ=="),
                 std::invalid_argument);
}

TEST(SecurityClientsTest, RenewSignsFreshToken) {
    auto clock = std::make_shared<test::FakeClock>(1700000000 - 3600);
    adapters::SymmetricKeyAuthenticationProvider provider("hub.example.net", "dev1", "", "dGVzdGtleQ==", clock);

    const std::string first = provider.getCurrentSasToken();
    clock->advance(std::chrono::seconds(30));
    EXPECT_EQ(provider.getCurrentSasToken(), first);

    const std::string renewed = provider.renewSasToken();
    EXPECT_NE(renewed, first);
    EXPECT_NE(renewed.find("&se=1700000030"), std::string::npos);
}
