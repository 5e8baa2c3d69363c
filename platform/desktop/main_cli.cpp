/**
 * @file main_cli.cpp
 * @brief Command-line device: provision through DPS, connect to IoT Hub, send telemetry
 *
 * With [provisioning] configured the device registers first and connects to
 * the hub it was assigned; otherwise [hub] connection_string is used as is.
 * SIGINT/SIGTERM stop the telemetry loop and shut both pipelines down.
 */

#include "ClientConfig.hpp"
#include "DeviceClient.hpp"
#include "IClock.hpp"
#include "PahoMqttClient.hpp"
#include "ProvisioningClient.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/SecurityClients.hpp"
#include "adapters/ThreadExecutor.hpp"
#include "pipeline/PipelineOptions.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace iotpipe;

/// Global flag for graceful shutdown coordination
static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int /*signal*/) {
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]      Configuration file (default: iotpipe.toml)\n"
              << "  --count [n]          Telemetry messages to send, 0 = until interrupted\n"
              << "  --interval [s]       Seconds between telemetry messages\n"
              << "  --provision-only     Register with DPS and exit\n"
              << "  --help               Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [provisioning]\n"
              << "  id_scope = \"0ne00000000\"\n"
              << "  registration_id = \"my-device\"\n"
              << "  symmetric_key = \"base64-key\"\n"
              << "\n"
              << "  [hub]\n"
              << "  connection_string = \"HostName=...;DeviceId=...;SharedAccessKey=...\"\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

namespace {

pipeline::PipelineOptions pipelineOptionsFor(const ClientConfig& config) {
    pipeline::PipelineOptions options;
    options.port = config.transport.port;
    options.tls.caPath = config.transport.caPath;
    options.tls.verifyServer = config.transport.verifyServerCert;
    options.provisioningTimeout = config.provisioning.timeout;
    if (config.retry.maxAttempts <= 1) {
        options.retryPolicy = std::make_shared<adapters::NoRetryPolicy>();
    } else {
        options.retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            config.retry.baseDelay, config.retry.multiplier, config.retry.maxDelay, config.retry.maxAttempts);
    }
    return options;
}

std::shared_ptr<PahoMqttClient> makeMqttClient(const ClientConfig& config) {
    PahoMqttClient::Options options;
    options.keepAliveSeconds = config.transport.keepAliveSeconds;
    return std::make_shared<PahoMqttClient>(options);
}

/// Wait for an async result while still honouring Ctrl+C
template <class T>
std::optional<T> waitFor(std::future<T>& future) {
    while (g_running) {
        if (future.wait_for(std::chrono::milliseconds(200)) == std::future_status::ready) {
            return future.get();
        }
    }
    return std::nullopt;
}

struct Outcome {
    std::optional<pipeline::Error> error;
    RegistrationResult result;
};

std::optional<RegistrationResult> provision(const ClientConfig& config) {
    const auto& dps = config.provisioning;
    std::shared_ptr<ports::ISecurityClient> securityClient;
    if (dps.usesSymmetricKey()) {
        std::cout << "Attestation: symmetric key" << std::endl;
        securityClient = std::make_shared<adapters::SymmetricKeySecurityClient>(
            dps.globalEndpoint, dps.registrationId, dps.idScope, dps.symmetricKey);
    } else {
        std::cout << "Attestation: X.509 (" << dps.certPath << ")" << std::endl;
        X509Certificate certificate{dps.certPath, dps.keyPath, dps.keyPassword};
        securityClient = std::make_shared<adapters::X509SecurityClient>(
            dps.globalEndpoint, dps.registrationId, dps.idScope, certificate);
    }

    ProvisioningClient client(securityClient, makeMqttClient(config),
                              std::make_shared<adapters::ThreadExecutor>("dps"), pipelineOptionsFor(config));

    auto done = std::make_shared<std::promise<Outcome>>();
    auto future = done->get_future();
    client.registerDevice([done](const std::optional<pipeline::Error>& error, const RegistrationResult& result) {
        done->set_value(Outcome{error, result});
    });

    auto outcome = waitFor(future);
    client.shutdown();
    if (!outcome) {
        return std::nullopt;
    }
    if (outcome->error) {
        std::cerr << "Provisioning failed: " << pipeline::toString(*outcome->error) << std::endl;
        return std::nullopt;
    }
    if (!outcome->result.isAssigned()) {
        std::cerr << "Registration ended with status '" << outcome->result.status << "'";
        if (!outcome->result.registrationState.errorMessage.empty()) {
            std::cerr << ": " << outcome->result.registrationState.errorMessage;
        }
        std::cerr << std::endl;
        return std::nullopt;
    }
    return outcome->result;
}

/// Run a DeviceClient call and block until it completes; the promise outlives an interrupted wait
std::optional<pipeline::Error> awaitCompletion(DeviceClient& client,
                                               void (DeviceClient::*method)(DeviceClient::Completion)) {
    auto done = std::make_shared<std::promise<std::optional<pipeline::Error>>>();
    auto future = done->get_future();
    (client.*method)([done](const std::optional<pipeline::Error>& error) { done->set_value(error); });
    auto result = waitFor(future);
    if (!result) {
        return pipeline::Error::shuttingDown("Interrupted");
    }
    return *result;
}

int runDevice(const ClientConfig& config, std::shared_ptr<ports::IAuthenticationProvider> authProvider) {
    DeviceClient client(authProvider, makeMqttClient(config),
                        std::make_shared<adapters::ThreadExecutor>("hub"), pipelineOptionsFor(config));

    client.setMethodRequestHandler([&client](const MethodRequest& request) {
        std::cout << "Method '" << request.name << "' invoked with " << request.payload.dump() << std::endl;
        MethodResponse response{request.requestId, 200, nlohmann::json{{"result", "ok"}}};
        client.sendMethodResponse(response, [](const std::optional<pipeline::Error>& error) {
            if (error) {
                std::cerr << "Method response failed: " << pipeline::toString(*error) << std::endl;
            }
        });
    });
    client.setC2DMessageHandler([](const Message& message) {
        std::cout << "C2D message: " << message.payload << std::endl;
    });
    client.setTwinPatchHandler([](const nlohmann::json& patch, int version) {
        std::cout << "Desired properties v" << version << ": " << patch.dump() << std::endl;
    });

    if (auto error = awaitCompletion(client, &DeviceClient::connect)) {
        std::cerr << "Connect failed: " << pipeline::toString(*error) << std::endl;
        return 1;
    }
    if (auto error = awaitCompletion(client, &DeviceClient::enableMethods)) {
        std::cerr << "Enabling methods failed: " << pipeline::toString(*error) << std::endl;
    }
    if (auto error = awaitCompletion(client, &DeviceClient::enableC2D)) {
        std::cerr << "Enabling C2D failed: " << pipeline::toString(*error) << std::endl;
    }

    SystemClock clock;
    int sent = 0;
    auto nextSend = std::chrono::steady_clock::now();
    while (g_running && (config.telemetry.count == 0 || sent < config.telemetry.count)) {
        if (std::chrono::steady_clock::now() >= nextSend) {
            Message message;
            message.payload = nlohmann::json{{"messageNumber", sent + 1}, {"timestamp", clock.iso8601()}}.dump();
            message.messageId = client.deviceId() + "-" + std::to_string(sent + 1);
            int number = sent + 1;
            client.sendTelemetry(message, [number](const std::optional<pipeline::Error>& error) {
                if (error) {
                    std::cerr << "Telemetry #" << number << " failed: " << pipeline::toString(*error) << std::endl;
                } else {
                    std::cout << "Telemetry #" << number << " delivered" << std::endl;
                }
            });
            ++sent;
            nextSend += std::chrono::seconds(config.telemetry.intervalSeconds);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (g_running) {
        if (auto error = awaitCompletion(client, &DeviceClient::disconnect)) {
            std::cerr << "Disconnect failed: " << pipeline::toString(*error) << std::endl;
        }
    }
    client.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configFile = "iotpipe.toml";
    std::optional<int> count;
    std::optional<int> interval;
    bool provisionOnly = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if (arg == "--count" && i + 1 < argc) {
                count = std::stoi(argv[++i]);
            } else if (arg == "--interval" && i + 1 < argc) {
                interval = std::stoi(argv[++i]);
            } else if (arg == "--provision-only") {
                provisionOnly = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    ClientConfig config;
    try {
        if (std::filesystem::exists(configFile)) {
            config = TomlConfig::loadFromFile(configFile);
        } else {
            std::cout << "[Config] " << configFile << " not found, using environment only" << std::endl;
        }
        TomlConfig::applyEnvironment(config, safeGetEnv);
        if (count) {
            config.telemetry.count = *count;
        }
        if (interval) {
            config.telemetry.intervalSeconds = *interval;
        }
        TomlConfig::validate(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        std::shared_ptr<ports::IAuthenticationProvider> authProvider;

        if (config.provisioning.enabled()) {
            std::cout << "Provisioning " << config.provisioning.registrationId
                      << " in scope " << config.provisioning.idScope << std::endl;
            auto result = provision(config);
            if (!result) {
                return g_running ? 1 : 0;
            }
            const auto& state = result->registrationState;
            std::cout << "Assigned hub: " << state.assignedHub << std::endl;
            std::cout << "Device ID: " << state.deviceId << std::endl;
            if (provisionOnly) {
                return 0;
            }
            if (!config.provisioning.usesSymmetricKey()) {
                std::cerr << "Hub connection with X.509 credentials is not supported by this CLI" << std::endl;
                return 1;
            }
            authProvider = std::make_shared<adapters::SymmetricKeyAuthenticationProvider>(
                state.assignedHub, state.deviceId, "", config.provisioning.symmetricKey);
        } else {
            authProvider = adapters::SymmetricKeyAuthenticationProvider::fromConnectionString(
                config.hub.connectionString);
        }

        std::cout << "Connecting " << authProvider->deviceId() << " to " << authProvider->hostname() << std::endl;
        int rc = runDevice(config, authProvider);
        std::cout << "Device stopped." << std::endl;
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
