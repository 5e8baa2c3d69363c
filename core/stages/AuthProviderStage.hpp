#pragma once

#include "../pipeline/Stage.hpp"

namespace iotpipe::stages {

/**
 * @brief Turns an IoT Hub authentication provider into connection arguments
 *
 * SetAuthenticationProvider becomes two steps: SetConnectionArgs with the
 * device identity, then SetCredentialToken with the current SAS token.
 */
class AuthProviderStage : public pipeline::Stage {
public:
    AuthProviderStage() : Stage("AuthProviderStage") {}

protected:
    void runOp(const pipeline::OperationPtr& op) override;
};

} // namespace iotpipe::stages
