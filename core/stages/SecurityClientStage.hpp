#pragma once

#include "../pipeline/Stage.hpp"

namespace iotpipe::stages {

/**
 * @brief Turns a DPS security client into connection arguments
 *
 * SetSymmetricKeySecurityClient and SetX509SecurityClient are each replaced
 * by one SetConnectionArgs carrying host, registration id, id scope and the
 * current token or certificate. Everything else passes through.
 */
class SecurityClientStage : public pipeline::Stage {
public:
    SecurityClientStage() : Stage("SecurityClientStage") {}

protected:
    void runOp(const pipeline::OperationPtr& op) override;
};

} // namespace iotpipe::stages
