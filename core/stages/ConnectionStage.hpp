#pragma once

#include "../pipeline/Stage.hpp"
#include <deque>

namespace iotpipe::stages {

/**
 * @brief Serializes connection changes and connects on demand
 *
 * While a Connect or Disconnect is below, every later operation waits and
 * is released in arrival order once it finishes. Operations that need a
 * connection trigger a Connect first when the pipeline is disconnected; if
 * that Connect fails they complete with its error.
 */
class ConnectionStage : public pipeline::Stage {
public:
    ConnectionStage() : Stage("ConnectionStage") {}

    static bool needsConnection(pipeline::OperationKind kind);

    bool isConnectionInFlight() const { return inFlight_; }
    std::size_t waitingCount() const { return waiting_.size(); }

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onEvent(const pipeline::EventPtr& event) override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    void changeConnection(const pipeline::OperationPtr& original, bool connect);
    void autoConnect(const pipeline::OperationPtr& trigger);
    void releaseWaiting(const std::optional<pipeline::Error>& connectError);

    bool inFlight_ = false;
    std::deque<pipeline::OperationPtr> waiting_;
};

} // namespace iotpipe::stages
