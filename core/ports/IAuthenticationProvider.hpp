#pragma once

#include <string>

namespace iotpipe::ports {

/**
 * @brief Credential source for a device connecting straight to IoT Hub
 */
class IAuthenticationProvider {
public:
    virtual ~IAuthenticationProvider() = default;

    virtual std::string hostname() const = 0;
    virtual std::string deviceId() const = 0;
    virtual std::string moduleId() const = 0;   ///< Empty for device identities
    virtual std::string getCurrentSasToken() = 0;
};

} // namespace iotpipe::ports
