#include "AuthProviderStage.hpp"
#include "../pipeline/OperationFlow.hpp"

#include <vector>

namespace iotpipe::stages {

using namespace pipeline;

void AuthProviderStage::runOp(const OperationPtr& op) {
    if (!op->is<ops::SetAuthenticationProvider>()) {
        passOpToNextStage(op);
        return;
    }

    const auto& provider = op->as<ops::SetAuthenticationProvider>().authProvider;

    ops::SetConnectionArgs args;
    args.host = provider->hostname();
    args.deviceId = provider->deviceId();
    args.moduleId = provider->moduleId();

    std::vector<OperationPtr> steps;
    steps.push_back(Operation::create(std::move(args)));
    steps.push_back(Operation::create(ops::SetCredentialToken{provider->getCurrentSasToken()}));
    delegateSequence(*this, op, std::move(steps));
}

} // namespace iotpipe::stages
