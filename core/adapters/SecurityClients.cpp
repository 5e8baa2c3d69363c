#include "SecurityClients.hpp"
#include "../../crypto/SasToken.hpp"

#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace iotpipe::adapters {

namespace {

void requireField(const std::string& value, const char* message) {
    if (value.empty()) {
        throw std::invalid_argument(message);
    }
}

void requireBase64Key(const std::string& keyBase64, const char* owner) {
    if (SasToken::base64Decode(keyBase64).empty()) {
        throw std::invalid_argument(std::string(owner) + ": shared access key is not valid base64");
    }
}

} // namespace

SasTokenCache::SasTokenCache(std::string resourceUri, std::string keyBase64, std::string keyName,
                             std::chrono::seconds ttl, std::shared_ptr<IClock> clock)
    : resourceUri_(std::move(resourceUri)),
      keyBase64_(std::move(keyBase64)),
      keyName_(std::move(keyName)),
      ttl_(ttl),
      clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("SasTokenCache: clock cannot be null");
    }
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("SasTokenCache: token lifetime must be positive");
    }
}

std::string SasTokenCache::current() {
    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t now = clock_->epochSeconds();
    const auto margin = static_cast<uint64_t>(ttl_.count() * kRenewalFraction);
    if (token_.empty() || now + margin >= expiry_) {
        expiry_ = now + static_cast<uint64_t>(ttl_.count());
        token_ = SasToken::generate(resourceUri_, keyBase64_, keyName_, expiry_);
    }
    return token_;
}

void SasTokenCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.clear();
}

SymmetricKeySecurityClient::SymmetricKeySecurityClient(std::string provisioningHost,
                                                       std::string registrationId,
                                                       std::string idScope,
                                                       std::string symmetricKeyBase64,
                                                       std::shared_ptr<IClock> clock,
                                                       std::chrono::seconds ttl)
    : provisioningHost_(std::move(provisioningHost)),
      registrationId_(std::move(registrationId)),
      idScope_(std::move(idScope)),
      tokens_(SasToken::registrationResourceUri(idScope_, registrationId_),
              symmetricKeyBase64, "registration", ttl, std::move(clock)) {
    requireField(provisioningHost_, "SymmetricKeySecurityClient: provisioning host cannot be empty");
    requireField(registrationId_, "SymmetricKeySecurityClient: registration id cannot be empty");
    requireField(idScope_, "SymmetricKeySecurityClient: id scope cannot be empty");
    requireBase64Key(symmetricKeyBase64, "SymmetricKeySecurityClient");
}

std::string SymmetricKeySecurityClient::getCurrentSasToken() {
    return tokens_.current();
}

X509SecurityClient::X509SecurityClient(std::string provisioningHost,
                                       std::string registrationId,
                                       std::string idScope,
                                       X509Certificate certificate)
    : provisioningHost_(std::move(provisioningHost)),
      registrationId_(std::move(registrationId)),
      idScope_(std::move(idScope)),
      certificate_(std::move(certificate)) {
    requireField(provisioningHost_, "X509SecurityClient: provisioning host cannot be empty");
    requireField(registrationId_, "X509SecurityClient: registration id cannot be empty");
    requireField(idScope_, "X509SecurityClient: id scope cannot be empty");
    if (certificate_.empty()) {
        throw std::invalid_argument("X509SecurityClient: certificate and key paths cannot be empty");
    }
}

SymmetricKeyAuthenticationProvider::SymmetricKeyAuthenticationProvider(std::string hostname,
                                                                       std::string deviceId,
                                                                       std::string moduleId,
                                                                       std::string sharedAccessKeyBase64,
                                                                       std::shared_ptr<IClock> clock,
                                                                       std::chrono::seconds ttl)
    : hostname_(std::move(hostname)),
      deviceId_(std::move(deviceId)),
      moduleId_(std::move(moduleId)),
      tokens_(SasToken::deviceResourceUri(hostname_, deviceId_, moduleId_),
              sharedAccessKeyBase64, "", ttl, std::move(clock)) {
    requireField(hostname_, "SymmetricKeyAuthenticationProvider: hostname cannot be empty");
    requireField(deviceId_, "SymmetricKeyAuthenticationProvider: device id cannot be empty");
    requireBase64Key(sharedAccessKeyBase64, "SymmetricKeyAuthenticationProvider");
}

std::shared_ptr<SymmetricKeyAuthenticationProvider> SymmetricKeyAuthenticationProvider::fromConnectionString(
    const std::string& connectionString, std::shared_ptr<IClock> clock) {
    std::map<std::string, std::string> fields;

    std::istringstream ss(connectionString);
    std::string part;
    while (std::getline(ss, part, ';')) {
        // Keys are split at the first '=', base64 values may end in '='
        size_t equalPos = part.find('=');
        if (equalPos != std::string::npos) {
            fields[part.substr(0, equalPos)] = part.substr(equalPos + 1);
        } else if (!part.empty()) {
            throw std::invalid_argument("Connection string: malformed segment '" + part + "'");
        }
    }

    auto field = [&fields](const char* key) {
        auto it = fields.find(key);
        return it == fields.end() ? std::string() : it->second;
    };

    const std::string host = field("HostName");
    const std::string deviceId = field("DeviceId");
    const std::string key = field("SharedAccessKey");
    if (host.empty() || deviceId.empty() || key.empty()) {
        throw std::invalid_argument("Connection string requires HostName, DeviceId and SharedAccessKey");
    }
    if (fields.count("GatewayHostName") != 0) {
        std::cout << "[Auth] GatewayHostName is ignored, connecting to " << host << std::endl;
    }

    return std::make_shared<SymmetricKeyAuthenticationProvider>(
        host, deviceId, field("ModuleId"), key, std::move(clock));
}

std::string SymmetricKeyAuthenticationProvider::getCurrentSasToken() {
    return tokens_.current();
}

std::string SymmetricKeyAuthenticationProvider::renewSasToken() {
    tokens_.invalidate();
    return tokens_.current();
}

} // namespace iotpipe::adapters
