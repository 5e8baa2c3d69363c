#pragma once

#include "../pipeline/Stage.hpp"
#include "../ports/IBlobUploader.hpp"
#include <cstdint>
#include <map>
#include <memory>

namespace iotpipe::stages {

/**
 * @brief Hands UploadBlob to an out-of-band uploader
 *
 * The uploader may finish on any thread; its result is posted back onto the
 * pipeline executor before the operation completes.
 */
class BlobUploadStage : public pipeline::Stage {
public:
    /// uploader may be null, UploadBlob then fails with a Configuration error
    explicit BlobUploadStage(std::shared_ptr<ports::IBlobUploader> uploader);

protected:
    void runOp(const pipeline::OperationPtr& op) override;
    void onShutdown(const pipeline::Error& reason) override;

private:
    void finishUpload(std::uint64_t opId, const std::optional<pipeline::Error>& error);

    std::shared_ptr<ports::IBlobUploader> uploader_;
    std::map<std::uint64_t, pipeline::OperationPtr> uploads_;
};

} // namespace iotpipe::stages
