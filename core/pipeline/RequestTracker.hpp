#pragma once

#include "Operation.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace iotpipe::pipeline {

/**
 * @brief Matches MQTT request/response pairs by $rid
 *
 * Used on the pipeline thread only.
 */
class RequestTracker {
public:
    /// Park op and return the request id to put on the wire
    std::string track(OperationPtr op);

    /// Remove and return the op waiting for rid, nullptr if unknown
    OperationPtr take(const std::string& rid);

    /// Forget every request parked for op
    void untrack(const OperationPtr& op);

    /// Remove and return every parked op in request order
    std::vector<OperationPtr> takeAll();

    bool empty() const { return pending_.empty(); }
    std::size_t size() const { return pending_.size(); }

private:
    std::uint64_t nextRid_ = 1;
    std::map<std::uint64_t, OperationPtr> pending_;
};

} // namespace iotpipe::pipeline
