/**
 * @file TomlConfig.hpp
 * @brief TOML configuration loader for the desktop CLI
 *
 * Supported Sections:
 * - [provisioning]: Device Provisioning Service endpoint and attestation
 * - [hub]: IoT Hub connection string, used when provisioning is not configured
 * - [transport]: MQTT port and TLS settings
 * - [retry]: Exponential backoff parameters
 * - [telemetry]: CLI send interval and count
 *
 * Environment variables override file values:
 * IOTPIPE_DPS_ENDPOINT, IOTPIPE_ID_SCOPE, IOTPIPE_REGISTRATION_ID,
 * IOTPIPE_SYMMETRIC_KEY, IOTPIPE_CONNECTION_STRING.
 *
 * @note Subset parser: sections, key = value, quoted strings, # comments
 */

#pragma once

#include "ClientConfig.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace iotpipe {

class TomlConfig {
public:
    /// Returns the variable's value or an empty string when unset
    using EnvLookup = std::function<std::string(const char* name)>;

    /**
     * @brief Load and parse a TOML configuration file
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument on a malformed line or value
     */
    static ClientConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return loadFromString(buffer.str());
    }

    /// @throws std::invalid_argument on a malformed line or value
    static ClientConfig loadFromString(const std::string& content) {
        ClientConfig config;
        std::istringstream input(content);
        std::string currentSection;
        std::string line;
        int lineNumber = 0;

        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);
            if (line.empty()) {
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']') {
                    throw std::invalid_argument("Line " + std::to_string(lineNumber) + ": unterminated section header");
                }
                currentSection = line.substr(1, line.length() - 2);
                trim(currentSection);
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw std::invalid_argument("Line " + std::to_string(lineNumber) + ": expected key = value");
            }
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            applyValue(config, currentSection, key, value);
        }

        return config;
    }

    /// Override file values with the IOTPIPE_* environment variables that are set
    static void applyEnvironment(ClientConfig& config, const EnvLookup& getEnv) {
        overrideWith(config.provisioning.globalEndpoint, getEnv("IOTPIPE_DPS_ENDPOINT"));
        overrideWith(config.provisioning.idScope, getEnv("IOTPIPE_ID_SCOPE"));
        overrideWith(config.provisioning.registrationId, getEnv("IOTPIPE_REGISTRATION_ID"));
        overrideWith(config.provisioning.symmetricKey, getEnv("IOTPIPE_SYMMETRIC_KEY"));
        overrideWith(config.hub.connectionString, getEnv("IOTPIPE_CONNECTION_STRING"));
    }

    /**
     * @brief Check that the configuration names a complete identity
     * @throws std::invalid_argument describing the first missing setting
     */
    static void validate(const ClientConfig& config) {
        const auto& dps = config.provisioning;
        if (!dps.enabled() && config.hub.connectionString.empty()) {
            throw std::invalid_argument("Configure [provisioning] id_scope or [hub] connection_string");
        }
        if (dps.enabled()) {
            if (dps.registrationId.empty()) {
                throw std::invalid_argument("[provisioning] registration_id is required");
            }
            if (!dps.usesSymmetricKey() && (dps.certPath.empty() || dps.keyPath.empty())) {
                throw std::invalid_argument("[provisioning] needs symmetric_key or cert_path and key_path");
            }
            validateCertificatePaths(config);
        }
        if (config.retry.maxAttempts < 1) {
            throw std::invalid_argument("[retry] max_attempts must be at least 1");
        }
    }

private:
    static void applyValue(ClientConfig& config, const std::string& section,
                           const std::string& key, const std::string& value) {
        if (section == "provisioning") {
            auto& dps = config.provisioning;
            if (key == "global_endpoint") {
                dps.globalEndpoint = value;
            } else if (key == "id_scope") {
                dps.idScope = value;
            } else if (key == "registration_id") {
                dps.registrationId = value;
            } else if (key == "symmetric_key") {
                dps.symmetricKey = value;
            } else if (key == "cert_path") {
                dps.certPath = value;
            } else if (key == "key_path") {
                dps.keyPath = value;
            } else if (key == "key_password") {
                dps.keyPassword = value;
            } else if (key == "timeout_seconds") {
                dps.timeout = std::chrono::seconds(toInt(key, value));
            } else {
                warnUnknown(section, key);
            }
        } else if (section == "hub") {
            if (key == "connection_string") {
                config.hub.connectionString = value;
            } else {
                warnUnknown(section, key);
            }
        } else if (section == "transport") {
            auto& transport = config.transport;
            if (key == "port") {
                int port = toInt(key, value);
                if (port <= 0 || port > 65535) {
                    throw std::invalid_argument("[transport] port out of range: " + value);
                }
                transport.port = static_cast<std::uint16_t>(port);
            } else if (key == "ca_path") {
                transport.caPath = value;
            } else if (key == "verify_server_cert") {
                transport.verifyServerCert = toBool(key, value);
            } else if (key == "keep_alive_seconds") {
                transport.keepAliveSeconds = toInt(key, value);
            } else {
                warnUnknown(section, key);
            }
        } else if (section == "retry") {
            auto& retry = config.retry;
            if (key == "base_delay_ms") {
                retry.baseDelay = std::chrono::milliseconds(toInt(key, value));
            } else if (key == "multiplier") {
                retry.multiplier = toDouble(key, value);
            } else if (key == "max_delay_ms") {
                retry.maxDelay = std::chrono::milliseconds(toInt(key, value));
            } else if (key == "max_attempts") {
                retry.maxAttempts = toInt(key, value);
            } else {
                warnUnknown(section, key);
            }
        } else if (section == "telemetry") {
            if (key == "interval_seconds") {
                config.telemetry.intervalSeconds = toInt(key, value);
            } else if (key == "count") {
                config.telemetry.count = toInt(key, value);
            } else {
                warnUnknown(section, key);
            }
        } else {
            warnUnknown(section, key);
        }
    }

    static void validateCertificatePaths(const ClientConfig& config) {
        namespace fs = std::filesystem;

        const auto& dps = config.provisioning;
        if (!dps.certPath.empty() && !fs::exists(dps.certPath)) {
            std::cerr << "[Config] Warning: Device certificate not found: " << dps.certPath << std::endl;
        }
        if (!dps.keyPath.empty() && !fs::exists(dps.keyPath)) {
            std::cerr << "[Config] Warning: Device private key not found: " << dps.keyPath << std::endl;
        }
        if (!config.transport.caPath.empty() && !fs::exists(config.transport.caPath)) {
            std::cerr << "[Config] Warning: Root CA certificate not found: " << config.transport.caPath << std::endl;
        }
    }

    static void warnUnknown(const std::string& section, const std::string& key) {
        std::cerr << "[Config] Ignoring unknown key '" << key << "' in [" << section << "]" << std::endl;
    }

    static int toInt(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            int result = std::stoi(value, &used);
            if (used == value.size()) {
                return result;
            }
        } catch (const std::logic_error&) {
        }
        throw std::invalid_argument("Invalid integer for " + key + ": " + value);
    }

    static double toDouble(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            double result = std::stod(value, &used);
            if (used == value.size()) {
                return result;
            }
        } catch (const std::logic_error&) {
        }
        throw std::invalid_argument("Invalid number for " + key + ": " + value);
    }

    static bool toBool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") {
            return true;
        }
        if (value == "false" || value == "0") {
            return false;
        }
        throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
    }

    static void overrideWith(std::string& target, const std::string& value) {
        if (!value.empty()) {
            target = value;
        }
    }

    /// Drop a trailing # comment, ignoring # inside double quotes
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace iotpipe
