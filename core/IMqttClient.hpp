/**
 * @file IMqttClient.hpp
 * @brief MQTT client seam below the pipeline's transport stage
 *
 * Provides a platform-independent MQTT client abstraction supporting SAS
 * token (password) authentication and X.509 client certificates, both over
 * TLS. Requests are asynchronous: a true return only means the request was
 * accepted, the outcome arrives through a callback.
 *
 * @note Callbacks may run on the client library's own threads
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace iotpipe {

/**
 * @brief MQTT message for device-to-cloud and cloud-to-device traffic
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "devices/{deviceId}/messages/events/")
    std::string payload;            ///< Message payload
    int qos = 0;                    ///< Quality of Service level (0, 1, or 2)
    bool retained = false;          ///< Retain flag
};

/**
 * @brief TLS settings for a connection
 *
 * certPath and keyPath select X.509 client authentication; leave them empty
 * for token authentication where TLS only protects the channel.
 *
 * @note Certificate files must be in PEM format
 */
struct TlsConfig {
    std::string certPath;           ///< Client certificate file (.pem)
    std::string keyPath;            ///< Private key file (.pem)
    std::string keyPassword;        ///< Private key pass phrase, empty if none
    std::string caPath;             ///< Trusted root CA file (.pem), empty for system default
    bool verifyServer = true;       ///< Enable server certificate validation
};

/**
 * @brief Asynchronous MQTT client interface
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /**
     * @brief Callback for connection state changes
     *
     * Fires with connected=true once a connect succeeds, and with
     * connected=false when a connect fails, the connection drops or a
     * requested disconnect finishes.
     */
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /// Outcome of a single publish, subscribe or unsubscribe request
    using CompletionCallback = std::function<void(bool success, const std::string& reason)>;

    /**
     * @brief Connect using username/password authentication over TLS
     * @param host Broker hostname (e.g., "your-hub.azure-devices.net")
     * @param port Broker port (8883 for MQTT over TLS)
     * @param clientId Client identifier (device or registration id)
     * @param username MQTT username carrying the API version
     * @param password MQTT password (SAS token)
     * @param tlsConfig Channel settings, client certificate fields ignored
     * @return true if the connection attempt was initiated
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                         const std::string& clientId,
                         const std::string& username,
                         const std::string& password,
                         const TlsConfig& tlsConfig) = 0;

    /**
     * @brief Connect using X.509 client certificate authentication
     * @param host Broker hostname (e.g., "global.azure-devices-provisioning.net")
     * @param port Broker port (8883 for MQTT over TLS)
     * @param clientId Client identifier (registration id for DPS)
     * @param username MQTT username carrying the API version
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if the connection attempt was initiated
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                                const std::string& clientId,
                                const std::string& username,
                                const TlsConfig& tlsConfig) = 0;

    /**
     * @brief Start a graceful disconnect
     * @return false if there was no connection to close
     */
    virtual bool disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @param onComplete Invoked once the broker acknowledged (or the request failed)
     * @return true if the request was accepted
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos, bool retained, CompletionCallback onComplete) = 0;

    virtual bool subscribe(const std::string& topic, int qos, CompletionCallback onComplete) = 0;

    virtual bool unsubscribe(const std::string& topic, CompletionCallback onComplete) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace iotpipe
