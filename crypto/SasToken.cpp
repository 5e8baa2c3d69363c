/**
 * @file SasToken.cpp
 * @brief Shared Access Signature generation with OpenSSL
 *
 * HMAC-SHA256 over the URL-encoded resource URI and expiry, keyed with the
 * decoded shared access key. Used for both IoT Hub device keys and DPS
 * enrollment keys.
 */

#include "SasToken.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace iotpipe {

std::string SasToken::generate(const Config& config) {
    uint64_t expiry = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() + config.expirySeconds;

    return generate(config.resourceUri, config.keyBase64, config.keyName, expiry);
}

/**
 * @brief Generate a SAS token with explicit parameters
 *
 * @param resourceUri Resource the token grants access to, not yet encoded
 * @param keyBase64 Base64-encoded shared access key
 * @param keyName Policy or key name appended as skn, omitted when empty
 * @param expiryEpochSeconds Token expiry as Unix timestamp
 * @return Token string for the MQTT password
 *
 * @throws std::invalid_argument if the URI is empty or the key does not decode
 */
std::string SasToken::generate(const std::string& resourceUri,
                               const std::string& keyBase64,
                               const std::string& keyName,
                               uint64_t expiryEpochSeconds) {
    if (resourceUri.empty()) {
        throw std::invalid_argument("SasToken: resource URI cannot be empty");
    }

    std::string key = base64Decode(keyBase64);
    if (key.empty()) {
        throw std::invalid_argument("SasToken: shared access key is not valid base64");
    }

    std::string stringToSign = createStringToSign(resourceUri, expiryEpochSeconds);
    std::string signatureBase64 = base64Encode(hmacSha256(key, stringToSign));

    std::stringstream token;
    token << "SharedAccessSignature sr=" << urlEncode(resourceUri)
          << "&sig=" << urlEncode(signatureBase64)
          << "&se=" << expiryEpochSeconds;
    if (!keyName.empty()) {
        token << "&skn=" << urlEncode(keyName);
    }

    return token.str();
}

std::string SasToken::deviceResourceUri(const std::string& host,
                                        const std::string& deviceId,
                                        const std::string& moduleId) {
    // Azure compares the resource URI with a lowercase hostname
    std::string lowerHost = host;
    std::transform(lowerHost.begin(), lowerHost.end(), lowerHost.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string uri = lowerHost + "/devices/" + deviceId;
    if (!moduleId.empty()) {
        uri += "/modules/" + moduleId;
    }
    return uri;
}

std::string SasToken::registrationResourceUri(const std::string& idScope, const std::string& registrationId) {
    return idScope + "/registrations/" + registrationId;
}

std::string SasToken::createStringToSign(const std::string& resourceUri, uint64_t expiry) {
    return urlEncode(resourceUri) + "\n" + std::to_string(expiry);
}

std::string SasToken::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.length()),
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.length(),
                                 digest, &digestLength);
    if (result == nullptr) {
        throw std::runtime_error("SasToken: HMAC-SHA256 computation failed");
    }

    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

/**
 * @brief Encode binary data to Base64 without newlines
 */
std::string SasToken::base64Encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.length()));
    BIO_flush(bio);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

/**
 * @brief Decode Base64 to binary
 * @return Decoded bytes, empty on decode failure
 */
std::string SasToken::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return std::string();
    }

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string result(encoded.length(), 0);
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));

    BIO_free_all(bio);

    if (decodedLength > 0) {
        result.resize(decodedLength);
    } else {
        result.clear();
    }

    return result;
}

/**
 * @brief Percent-encode everything except RFC 3986 unreserved characters
 */
std::string SasToken::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

} // namespace iotpipe
