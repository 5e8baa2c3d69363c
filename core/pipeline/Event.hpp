#pragma once

#include "../IMqttClient.hpp"
#include "../Models.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace iotpipe::pipeline {

namespace events {

struct ConnectionStateChanged {
    bool connected = false;
    std::string reason;
};

/// Raw inbound MQTT message, consumed by the protocol stages
struct MessageReceived {
    MqttMessage message;
};

struct C2DMessageReceived {
    Message message;
};

struct MethodRequestReceived {
    MethodRequest request;
};

struct TwinPatchReceived {
    nlohmann::json patch;
    int version = 0;
};

using Payload = std::variant<
    ConnectionStateChanged,
    MessageReceived,
    C2DMessageReceived,
    MethodRequestReceived,
    TwinPatchReceived>;

} // namespace events

enum class EventKind {
    ConnectionStateChanged,
    MessageReceived,
    C2DMessageReceived,
    MethodRequestReceived,
    TwinPatchReceived
};

/**
 * @brief Notification flowing up the pipeline
 *
 * Events are immutable and never completed. They travel from the stage that
 * raised them towards the head until a stage consumes them or they reach
 * the pipeline's event sink.
 */
class Event {
public:
    explicit Event(events::Payload payload) : payload_(std::move(payload)) {}

    EventKind kind() const { return static_cast<EventKind>(payload_.index()); }
    std::string name() const;

    const events::Payload& payload() const { return payload_; }

    template <class T>
    bool is() const { return std::holds_alternative<T>(payload_); }

    template <class T>
    const T& as() const { return std::get<T>(payload_); }

private:
    events::Payload payload_;
};

using EventPtr = std::shared_ptr<const Event>;

inline EventPtr makeEvent(events::Payload payload) {
    return std::make_shared<const Event>(std::move(payload));
}

std::string eventKindToString(EventKind kind);

} // namespace iotpipe::pipeline
