#include "JsonCodec.hpp"

namespace iotpipe {

std::string JsonCodec::registrationRequest(const std::string& registrationId, const nlohmann::json& payload) {
    nlohmann::json j;
    j["registrationId"] = registrationId;
    if (!payload.is_null()) {
        j["payload"] = payload;
    }
    return j.dump();
}

RegistrationResult JsonCodec::parseRegistrationResult(const std::string& json) {
    return jsonToRegistrationResult(nlohmann::json::parse(json));
}

RegistrationResult JsonCodec::jsonToRegistrationResult(const nlohmann::json& json) {
    RegistrationResult result;
    result.operationId = json.value("operationId", "");
    result.status = json.value("status", "");

    if (json.contains("registrationState") && json["registrationState"].is_object()) {
        result.registrationState = jsonToRegistrationState(json["registrationState"]);
    }
    return result;
}

RegistrationState JsonCodec::jsonToRegistrationState(const nlohmann::json& json) {
    RegistrationState state;
    state.registrationId = json.value("registrationId", "");
    state.assignedHub = json.value("assignedHub", "");
    state.deviceId = json.value("deviceId", "");
    state.status = json.value("status", "");
    state.substatus = json.value("substatus", "");
    state.etag = json.value("etag", "");
    state.createdDateTimeUtc = json.value("createdDateTimeUtc", "");
    state.lastUpdatedDateTimeUtc = json.value("lastUpdatedDateTimeUtc", "");
    state.errorCode = json.value("errorCode", 0);
    state.errorMessage = json.value("errorMessage", "");

    if (json.contains("payload")) {
        state.payload = json["payload"];
    }
    return state;
}

nlohmann::json JsonCodec::registrationResultToJson(const RegistrationResult& result) {
    const auto& state = result.registrationState;

    nlohmann::json j;
    j["operationId"] = result.operationId;
    j["status"] = result.status;

    nlohmann::json s;
    s["registrationId"] = state.registrationId;
    s["assignedHub"] = state.assignedHub;
    s["deviceId"] = state.deviceId;
    s["status"] = state.status;
    s["substatus"] = state.substatus;
    s["etag"] = state.etag;
    s["createdDateTimeUtc"] = state.createdDateTimeUtc;
    s["lastUpdatedDateTimeUtc"] = state.lastUpdatedDateTimeUtc;
    if (state.errorCode != 0) {
        s["errorCode"] = state.errorCode;
        s["errorMessage"] = state.errorMessage;
    }
    if (!state.payload.is_null()) {
        s["payload"] = state.payload;
    }
    j["registrationState"] = s;
    return j;
}

std::string JsonCodec::errorMessage(const std::string& body) {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object()) {
        if (json.contains("message") && json["message"].is_string()) {
            return json["message"].get<std::string>();
        }
        if (json.contains("Message") && json["Message"].is_string()) {
            return json["Message"].get<std::string>();
        }
    }
    return body;
}

nlohmann::json JsonCodec::parsePayload(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return body;
    }
    return json;
}

std::string JsonCodec::serializePayload(const nlohmann::json& payload) {
    return payload.is_null() ? std::string() : payload.dump();
}

} // namespace iotpipe
