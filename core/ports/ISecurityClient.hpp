#pragma once

#include "../Models.hpp"
#include <string>

namespace iotpipe::ports {

/**
 * @brief Credential source for Device Provisioning Service registration
 *
 * Implementations own the credential material; the pipeline only reads the
 * identity fields and the current token or certificate.
 */
class ISecurityClient {
public:
    virtual ~ISecurityClient() = default;

    virtual std::string provisioningHost() const = 0;
    virtual std::string registrationId() const = 0;
    virtual std::string idScope() const = 0;
};

class ISymmetricKeySecurityClient : public ISecurityClient {
public:
    virtual std::string getCurrentSasToken() = 0;
};

class IX509SecurityClient : public ISecurityClient {
public:
    virtual X509Certificate getX509Certificate() const = 0;
};

} // namespace iotpipe::ports
