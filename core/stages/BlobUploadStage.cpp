#include "BlobUploadStage.hpp"
#include "../pipeline/PipelineContext.hpp"

#include <iostream>
#include <utility>

namespace iotpipe::stages {

using namespace pipeline;

BlobUploadStage::BlobUploadStage(std::shared_ptr<ports::IBlobUploader> uploader)
    : Stage("BlobUploadStage"), uploader_(std::move(uploader)) {
}

void BlobUploadStage::runOp(const OperationPtr& op) {
    if (!op->is<ops::UploadBlob>()) {
        passOpToNextStage(op);
        return;
    }
    if (!uploader_) {
        op->complete(Error::configuration("No blob uploader configured"));
        return;
    }

    const auto& upload = op->as<ops::UploadBlob>();
    const std::uint64_t opId = op->id();
    uploads_.emplace(opId, op);

    std::cout << "[Blob] Uploading " << upload.blobName << " (" << upload.content.size() << " bytes)" << std::endl;

    std::weak_ptr<ports::IExecutor> executor = context().executorPtr();
    uploader_->upload(upload.blobName, upload.content,
        [this, executor, opId](const std::optional<Error>& error) {
            auto target = executor.lock();
            if (!target) {
                return;
            }
            // A refused post means teardown has already failed the upload
            target->post([this, opId, error] { finishUpload(opId, error); });
        });
}

void BlobUploadStage::finishUpload(std::uint64_t opId, const std::optional<Error>& error) {
    auto it = uploads_.find(opId);
    if (it == uploads_.end()) {
        return;
    }
    OperationPtr op = std::move(it->second);
    uploads_.erase(it);

    if (error) {
        std::cerr << "[Blob] " << op->name() << " failed: " << toString(*error) << std::endl;
    }
    op->complete(error);
}

void BlobUploadStage::onShutdown(const Error& reason) {
    auto uploads = std::move(uploads_);
    uploads_.clear();
    for (auto& entry : uploads) {
        entry.second->complete(reason);
    }
}

} // namespace iotpipe::stages
