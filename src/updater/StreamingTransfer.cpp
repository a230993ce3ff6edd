#include "StreamingTransfer.hpp"

#include <plog/Log.h>

#include <fstream>

namespace updater
{

StreamingTransfer::StreamingTransfer(std::shared_ptr<utils::IHttpClient> http, ScratchStorage storage,
                                     std::shared_ptr<IProgressEvents> events, utils::SessionConfig session)
    : http_(std::move(http))
    , storage_(std::move(storage))
    , events_(std::move(events))
    , session_(session)
{
}

bool StreamingTransfer::transfer(const TransferRequest& request, std::string& outLocation, UpdateError& outError)
{
    const std::string& artifactName = request.artifactName;

    // Released on every exit path below
    ProgressSubscription subscription;
    if (request.onProgress)
    {
        subscription = ProgressSubscription(
            *events_,
            [artifactName, onProgress = request.onProgress](const TransferProgress& progress)
            {
                if (progress.artifactName != artifactName || progress.totalBytes == 0)
                {
                    return;
                }
                onProgress(toPercentage(progress.bytesTransferred, progress.totalBytes));
            });
    }

    std::string storageError;
    std::ofstream out;
    if (!storage_.openForWrite(artifactName, out, storageError))
    {
        outError = UpdateError(UpdateErrorKind::Storage, messages::kDownloadFailed, storageError, 0);
        return false;
    }

    utils::HttpResponse response;
    try
    {
        response = http_->download(request.url, out, session_,
                                   [this, &artifactName](std::uint64_t now, std::uint64_t total)
                                   { events_->emit(TransferProgress(artifactName, now, total)); });
    }
    catch (const std::exception& e)
    {
        out.close();
        storage_.remove(artifactName);
        outError = UpdateError(UpdateErrorKind::Network, messages::kDownloadFailed, e.what(), 0);
        PLOG_ERROR << "Streaming download aborted: " << e.what();
        return false;
    }

    out.close();

    if (!response.ok())
    {
        storage_.remove(artifactName);
        outError = transferErrorFromResponse(response);
        PLOG_ERROR << "Download failed: " << outError.message
                   << (outError.technicalInfo.empty() ? "" : " (" + outError.technicalInfo + ")");
        return false;
    }

    if (!out)
    {
        storage_.remove(artifactName);
        outError = UpdateError(UpdateErrorKind::Storage, messages::kDownloadFailed,
                               "Failed to write artifact " + artifactName, 0);
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }

    // The location comes from the storage that holds the file, not from the transfer call
    if (!storage_.resolveLocation(artifactName, outLocation, storageError))
    {
        outError = UpdateError(UpdateErrorKind::Storage, messages::kDownloadFailed, storageError, 0);
        return false;
    }

    PLOG_INFO << "Download completed: " << outLocation;
    return true;
}

} // namespace updater
