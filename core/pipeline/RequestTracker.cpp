#include "RequestTracker.hpp"

#include <utility>

namespace iotpipe::pipeline {

std::string RequestTracker::track(OperationPtr op) {
    const std::uint64_t rid = nextRid_++;
    pending_.emplace(rid, std::move(op));
    return std::to_string(rid);
}

OperationPtr RequestTracker::take(const std::string& rid) {
    std::uint64_t key = 0;
    try {
        std::size_t used = 0;
        key = std::stoull(rid, &used);
        if (used != rid.size()) {
            return nullptr;
        }
    } catch (const std::exception&) {
        return nullptr;
    }

    auto it = pending_.find(key);
    if (it == pending_.end()) {
        return nullptr;
    }
    OperationPtr op = std::move(it->second);
    pending_.erase(it);
    return op;
}

void RequestTracker::untrack(const OperationPtr& op) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second == op) {
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<OperationPtr> RequestTracker::takeAll() {
    std::vector<OperationPtr> ops;
    ops.reserve(pending_.size());
    for (auto& entry : pending_) {
        ops.push_back(std::move(entry.second));
    }
    pending_.clear();
    return ops;
}

} // namespace iotpipe::pipeline
