#include "DeviceClient.hpp"
#include "pipeline/Event.hpp"
#include "pipeline/PipelineFactory.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace iotpipe {

using pipeline::Error;
using pipeline::Operation;
namespace ops = pipeline::ops;

DeviceClient::DeviceClient(std::shared_ptr<ports::IAuthenticationProvider> authProvider,
                           std::shared_ptr<IMqttClient> mqttClient,
                           std::shared_ptr<ports::IExecutor> executor,
                           const pipeline::PipelineOptions& options)
    : authProvider_(std::move(authProvider)) {
    if (!authProvider_) {
        throw std::invalid_argument("DeviceClient: authentication provider cannot be null");
    }
    deviceId_ = authProvider_->deviceId();
    pipeline_ = pipeline::createIoTHubPipeline(std::move(mqttClient), std::move(executor), options);
    pipeline_->registerEventSink([this](const pipeline::EventPtr& event) { dispatchEvent(event); });

    // Queued ahead of anything the caller submits, so every later op sees the identity
    submit(ops::SetAuthenticationProvider{authProvider_}, [](const std::optional<Error>& error) {
        if (error) {
            std::cerr << "[Hub] Authentication provider rejected: " << pipeline::toString(*error) << std::endl;
        }
    });
}

DeviceClient::~DeviceClient() {
    shutdown();
}

void DeviceClient::submit(ops::Payload payload, Completion done) {
    pipeline_->submit(std::move(payload),
        [done = std::move(done)](Operation&, const std::optional<Error>& error) {
            if (done) {
                done(error);
            }
        });
}

void DeviceClient::connect(Completion done) {
    std::cout << "[Hub] Connecting " << deviceId_ << " to " << authProvider_->hostname() << std::endl;
    submit(ops::Connect{}, std::move(done));
}

void DeviceClient::disconnect(Completion done) {
    submit(ops::Disconnect{}, std::move(done));
}

void DeviceClient::sendTelemetry(Message message, Completion done) {
    submit(ops::SendTelemetry{std::move(message)}, std::move(done));
}

void DeviceClient::sendMethodResponse(MethodResponse response, Completion done) {
    submit(ops::SendMethodResponse{std::move(response)}, std::move(done));
}

void DeviceClient::getTwin(TwinCallback done) {
    pipeline_->submit(ops::GetTwin{},
        [done = std::move(done)](Operation& op, const std::optional<Error>& error) {
            if (done) {
                done(error, op.as<ops::GetTwin>().twin);
            }
        });
}

void DeviceClient::patchReportedProperties(nlohmann::json patch, PatchCallback done) {
    pipeline_->submit(ops::PatchTwinReportedProperties{std::move(patch), 0},
        [done = std::move(done)](Operation& op, const std::optional<Error>& error) {
            if (done) {
                done(error, op.as<ops::PatchTwinReportedProperties>().version);
            }
        });
}

void DeviceClient::enableMethods(Completion done) {
    submit(ops::EnableFeature{Feature::Methods}, std::move(done));
}

void DeviceClient::enableC2D(Completion done) {
    submit(ops::EnableFeature{Feature::C2D}, std::move(done));
}

void DeviceClient::enableTwinPatches(Completion done) {
    submit(ops::EnableFeature{Feature::Twin}, std::move(done));
}

void DeviceClient::uploadBlob(std::string blobName, std::string content, Completion done) {
    submit(ops::UploadBlob{std::move(blobName), std::move(content)}, std::move(done));
}

void DeviceClient::renewToken(Completion done) {
    std::string token;
    try {
        token = authProvider_->getCurrentSasToken();
    } catch (const std::exception& e) {
        if (done) {
            done(Error::configuration(std::string("SAS token renewal failed: ") + e.what()));
        }
        return;
    }
    submit(ops::SetCredentialToken{std::move(token)}, std::move(done));
}

void DeviceClient::setMethodRequestHandler(MethodRequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    methodHandler_ = std::move(handler);
}

void DeviceClient::setC2DMessageHandler(C2DMessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    c2dHandler_ = std::move(handler);
}

void DeviceClient::setTwinPatchHandler(TwinPatchHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    twinPatchHandler_ = std::move(handler);
}

void DeviceClient::setConnectionStateHandler(ConnectionStateHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    connectionHandler_ = std::move(handler);
}

void DeviceClient::dispatchEvent(const pipeline::EventPtr& event) {
    std::unique_lock<std::mutex> lock(handlerMutex_);
    std::visit(pipeline::Overloaded{
        [&](const pipeline::events::MethodRequestReceived& e) {
            auto handler = methodHandler_;
            lock.unlock();
            if (handler) {
                handler(e.request);
            } else {
                std::cout << "[Hub] No handler for method " << e.request.name << std::endl;
            }
        },
        [&](const pipeline::events::C2DMessageReceived& e) {
            auto handler = c2dHandler_;
            lock.unlock();
            if (handler) {
                handler(e.message);
            }
        },
        [&](const pipeline::events::TwinPatchReceived& e) {
            auto handler = twinPatchHandler_;
            lock.unlock();
            if (handler) {
                handler(e.patch, e.version);
            }
        },
        [&](const pipeline::events::ConnectionStateChanged& e) {
            auto handler = connectionHandler_;
            lock.unlock();
            if (handler) {
                handler(e.connected, e.reason);
            }
        },
        [&](const pipeline::events::MessageReceived& e) {
            lock.unlock();
            std::cout << "[Hub] Unhandled message on " << e.message.topic << std::endl;
        },
    }, event->payload());
}

void DeviceClient::shutdown() {
    if (pipeline_) {
        pipeline_->shutdown();
    }
}

} // namespace iotpipe
