#include "BufferedTransfer.hpp"
#include "utils/Base64.hpp"

#include <plog/Log.h>

#include <new>
#include <stdexcept>

namespace updater
{

BufferedTransfer::BufferedTransfer(std::shared_ptr<utils::IHttpClient> http, ScratchStorage storage,
                                   utils::SessionConfig session, PayloadEncoder encoder)
    : http_(std::move(http))
    , storage_(std::move(storage))
    , session_(session)
    , encoder_(encoder ? std::move(encoder) : PayloadEncoder(utils::Base64Encode))
{
}

bool BufferedTransfer::transfer(const TransferRequest& request, std::string& outLocation, UpdateError& outError)
{
    utils::HttpResponse response;
    try
    {
        response = http_->getBinary(request.url, session_,
                                    [&request](std::uint64_t now, std::uint64_t total)
                                    {
                                        if (request.onProgress && total > 0)
                                        {
                                            request.onProgress(toPercentage(now, total));
                                        }
                                    });
    }
    catch (const std::exception& e)
    {
        outError = UpdateError(UpdateErrorKind::Network, messages::kDownloadFailed, e.what(), 0);
        PLOG_ERROR << "Buffered download aborted: " << e.what();
        return false;
    }

    if (!response.ok())
    {
        outError = transferErrorFromResponse(response);
        PLOG_ERROR << "Download failed: " << outError.message
                   << (outError.technicalInfo.empty() ? "" : " (" + outError.technicalInfo + ")");
        return false;
    }

    PLOG_INFO << "Download finished (" << response.text.size() << " bytes), encoding payload...";

    std::string encoded;
    try
    {
        encoded = encoder_(response.text);
        // Drop the raw copy before the storage layer decodes it again
        std::string().swap(response.text);
    }
    catch (const std::bad_alloc& e)
    {
        outError = UpdateError(UpdateErrorKind::ConversionFailed, messages::kConversionFailed, e.what(), 0);
        PLOG_ERROR << outError.message;
        return false;
    }
    catch (const std::length_error& e)
    {
        outError = UpdateError(UpdateErrorKind::ConversionFailed, messages::kConversionFailed, e.what(), 0);
        PLOG_ERROR << outError.message;
        return false;
    }

    PLOG_INFO << "Writing file to cache...";

    std::string storageError;
    bool written = false;
    try
    {
        written = storage_.writeEncoded(request.artifactName, encoded, outLocation, storageError);
    }
    catch (const std::bad_alloc& e)
    {
        storage_.remove(request.artifactName);
        outError = UpdateError(UpdateErrorKind::ConversionFailed, messages::kConversionFailed, e.what(), 0);
        PLOG_ERROR << outError.message;
        return false;
    }

    if (!written)
    {
        outError = UpdateError(UpdateErrorKind::Storage, messages::kDownloadFailed, storageError, 0);
        return false;
    }

    PLOG_INFO << "Download completed: " << outLocation;
    return true;
}

} // namespace updater
