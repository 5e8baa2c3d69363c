#include "MqttTopics.hpp"
#include "../crypto/SasToken.hpp"

#include <cctype>
#include <regex>

namespace iotpipe::topics {

namespace {

std::optional<int> toInt(const std::string& value) {
    try {
        std::size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string queryOf(const std::string& topic) {
    const auto pos = topic.find('?');
    return pos == std::string::npos ? std::string() : topic.substr(pos + 1);
}

/// key is written as given; system property names keep their literal "$."
void appendProperty(std::string& topic, bool& first, const std::string& key, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (!first) {
        topic += '&';
    }
    topic += key + "=" + SasToken::urlEncode(value);
    first = false;
}

} // namespace

std::string dpsUsername(const std::string& idScope, const std::string& registrationId) {
    return idScope + "/registrations/" + registrationId + "/api-version=" + kDpsApiVersion;
}

std::string dpsRegisterTopic(const std::string& rid) {
    return "$dps/registrations/PUT/iotdps-register/?$rid=" + rid;
}

std::string dpsQueryTopic(const std::string& rid, const std::string& operationId) {
    return "$dps/registrations/GET/iotdps-get-operationstatus/?$rid=" + rid + "&operationId=" + operationId;
}

std::optional<DpsResponse> parseDpsResponseTopic(const std::string& topic) {
    static const std::regex statusRegex(R"(^\$dps/registrations/res/(\d{3})/)");
    std::smatch match;
    if (!std::regex_search(topic, match, statusRegex)) {
        return std::nullopt;
    }

    DpsResponse response;
    response.status = std::stoi(match[1].str());

    const auto query = parseQuery(queryOf(topic));
    auto rid = query.find("$rid");
    if (rid == query.end()) {
        return std::nullopt;
    }
    response.rid = rid->second;

    auto retryAfter = query.find("retry-after");
    if (retryAfter != query.end()) {
        if (auto seconds = toInt(retryAfter->second); seconds && *seconds >= 0) {
            response.retryAfter = std::chrono::seconds(*seconds);
        }
    }
    return response;
}

std::string hubClientId(const std::string& deviceId, const std::string& moduleId) {
    return moduleId.empty() ? deviceId : deviceId + "/" + moduleId;
}

std::string hubUsername(const std::string& host, const std::string& clientId) {
    return host + "/" + clientId + "/?api-version=" + kHubApiVersion;
}

std::string telemetryTopic(const std::string& deviceId, const std::string& moduleId, const Message& message) {
    std::string topic = "devices/" + deviceId;
    if (!moduleId.empty()) {
        topic += "/modules/" + moduleId;
    }
    topic += "/messages/events/";

    bool first = true;
    appendProperty(topic, first, "$.mid", message.messageId);
    appendProperty(topic, first, "$.cid", message.correlationId);
    appendProperty(topic, first, "$.ct", message.contentType);
    appendProperty(topic, first, "$.ce", message.contentEncoding);
    appendProperty(topic, first, "$.sub", message.componentName);
    for (const auto& [key, value] : message.customProperties) {
        appendProperty(topic, first, SasToken::urlEncode(key), value);
    }
    return topic;
}

std::string c2dSubscription(const std::string& deviceId) {
    return c2dPrefix(deviceId) + "#";
}

std::string c2dPrefix(const std::string& deviceId) {
    return "devices/" + deviceId + "/messages/devicebound/";
}

std::string methodResponseTopic(int status, const std::string& rid) {
    return "$iothub/methods/res/" + std::to_string(status) + "/?$rid=" + rid;
}

std::string twinGetTopic(const std::string& rid) {
    return "$iothub/twin/GET/?$rid=" + rid;
}

std::string twinReportedTopic(const std::string& rid) {
    return "$iothub/twin/PATCH/properties/reported/?$rid=" + rid;
}

std::optional<MethodRequestTopic> parseMethodRequestTopic(const std::string& topic) {
    static const std::regex methodRegex(R"(^\$iothub/methods/POST/([^/]+)/\?\$rid=([^&]+))");
    std::smatch match;
    if (!std::regex_search(topic, match, methodRegex)) {
        return std::nullopt;
    }
    return MethodRequestTopic{urlDecode(match[1].str()), match[2].str()};
}

std::optional<TwinResponseTopic> parseTwinResponseTopic(const std::string& topic) {
    static const std::regex statusRegex(R"(^\$iothub/twin/res/(\d{3})/)");
    std::smatch match;
    if (!std::regex_search(topic, match, statusRegex)) {
        return std::nullopt;
    }

    TwinResponseTopic response;
    response.status = std::stoi(match[1].str());

    const auto query = parseQuery(queryOf(topic));
    auto rid = query.find("$rid");
    if (rid == query.end()) {
        return std::nullopt;
    }
    response.rid = rid->second;

    auto version = query.find("$version");
    if (version != query.end()) {
        response.version = toInt(version->second).value_or(0);
    }
    return response;
}

int parseTwinPatchVersion(const std::string& topic) {
    const auto query = parseQuery(queryOf(topic));
    auto version = query.find("$version");
    return version == query.end() ? 0 : toInt(version->second).value_or(0);
}

Message parseC2DTopic(const std::string& topic, const std::string& deviceId, const std::string& payload) {
    Message message;
    message.payload = payload;
    message.contentType.clear();
    message.contentEncoding.clear();

    const std::string prefix = c2dPrefix(deviceId);
    const std::string bag = topic.compare(0, prefix.size(), prefix) == 0 ? topic.substr(prefix.size()) : std::string();

    for (const auto& [key, value] : parseQuery(bag)) {
        if (key == "$.mid") {
            message.messageId = value;
        } else if (key == "$.cid") {
            message.correlationId = value;
        } else if (key == "$.ct") {
            message.contentType = value;
        } else if (key == "$.ce") {
            message.contentEncoding = value;
        } else if (key.compare(0, 2, "$.") == 0 || key.compare(0, 6, "iothub") == 0) {
            continue;
        } else {
            message.customProperties[key] = value;
        }
    }
    return message;
}

std::map<std::string, std::string> parseQuery(const std::string& query) {
    std::map<std::string, std::string> result;
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                result[urlDecode(pair)] = "";
            } else {
                result[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return result;
}

std::string urlDecode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            decoded += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            decoded += value[i];
        }
    }
    return decoded;
}

} // namespace iotpipe::topics
