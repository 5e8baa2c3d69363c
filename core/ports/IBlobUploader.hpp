#pragma once

#include "../pipeline/Error.hpp"
#include <functional>
#include <optional>
#include <string>

namespace iotpipe::ports {

class IBlobUploader {
public:
    using Completion = std::function<void(const std::optional<pipeline::Error>& error)>;

    virtual ~IBlobUploader() = default;

    /// May invoke done from any thread, exactly once
    virtual void upload(const std::string& blobName, const std::string& content, Completion done) = 0;
};

} // namespace iotpipe::ports
