#include "SecurityClientStage.hpp"
#include "../pipeline/OperationFlow.hpp"

namespace iotpipe::stages {

using namespace pipeline;

void SecurityClientStage::runOp(const OperationPtr& op) {
    std::visit(Overloaded{
        [&](const ops::SetSymmetricKeySecurityClient& p) {
            ops::SetConnectionArgs args;
            args.host = p.securityClient->provisioningHost();
            args.registrationId = p.securityClient->registrationId();
            args.idScope = p.securityClient->idScope();
            args.sasToken = p.securityClient->getCurrentSasToken();
            delegateToDifferentOp(*this, op, Operation::create(std::move(args)));
        },
        [&](const ops::SetX509SecurityClient& p) {
            ops::SetConnectionArgs args;
            args.host = p.securityClient->provisioningHost();
            args.registrationId = p.securityClient->registrationId();
            args.idScope = p.securityClient->idScope();
            args.clientCertificate = p.securityClient->getX509Certificate();
            delegateToDifferentOp(*this, op, Operation::create(std::move(args)));
        },
        [&](const auto&) { passOpToNextStage(op); }
    }, op->payload());
}

} // namespace iotpipe::stages
