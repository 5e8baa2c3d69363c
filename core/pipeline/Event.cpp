#include "Event.hpp"

namespace iotpipe::pipeline {

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::ConnectionStateChanged: return "ConnectionStateChanged";
        case EventKind::MessageReceived:        return "MessageReceived";
        case EventKind::C2DMessageReceived:     return "C2DMessageReceived";
        case EventKind::MethodRequestReceived:  return "MethodRequestReceived";
        case EventKind::TwinPatchReceived:      return "TwinPatchReceived";
    }
    return "Unknown";
}

std::string Event::name() const {
    return eventKindToString(kind());
}

} // namespace iotpipe::pipeline
