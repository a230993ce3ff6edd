#include "ArtifactDownloader.hpp"
#include "BufferedTransfer.hpp"
#include "StreamingTransfer.hpp"

#include <plog/Log.h>

namespace updater
{

std::unique_ptr<ITransferStrategy> createTransferStrategy(const platform::PlatformCapabilities& caps,
                                                          std::shared_ptr<utils::IHttpClient> http,
                                                          const ScratchStorage& storage,
                                                          std::shared_ptr<IProgressEvents> events,
                                                          utils::SessionConfig session)
{
    if (caps.streamingDownload && events)
    {
        return std::make_unique<StreamingTransfer>(std::move(http), storage, std::move(events), session);
    }
    return std::make_unique<BufferedTransfer>(std::move(http), storage, session);
}

ArtifactDownloader::ArtifactDownloader(bool platformSupported, std::unique_ptr<ITransferStrategy> strategy,
                                       ScratchStorage storage, std::string artifactExtension)
    : platformSupported_(platformSupported)
    , strategy_(std::move(strategy))
    , storage_(std::move(storage))
    , artifactExtension_(std::move(artifactExtension))
{
    PLOG_DEBUG << "Artifact downloader using " << strategyName() << " transfers into " << storage_.root().string();
}

ArtifactDownloader::~ArtifactDownloader() = default;

bool ArtifactDownloader::download(const std::string& url, const DownloadProgressCallback& onProgress,
                                  std::string& outLocation, UpdateError& outError)
{
    if (!platformSupported_)
    {
        outError = UpdateError(UpdateErrorKind::UnsupportedPlatform, messages::kUnsupportedPlatform);
        PLOG_WARNING << "Download refused: " << outError.message;
        return false;
    }

    if (!strategy_)
    {
        outError = UpdateError(UpdateErrorKind::UnsupportedPlatform, messages::kUnsupportedPlatform,
                               "No transfer strategy configured", 0);
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }

    if (url.empty())
    {
        outError = UpdateError(UpdateErrorKind::Network, messages::kDownloadFailed, "No download URL", 0);
        PLOG_ERROR << "Download failed: empty URL";
        return false;
    }

    TransferRequest request;
    request.url = url;
    request.artifactName = storage_.uniqueArtifactName(artifactExtension_);
    request.onProgress = onProgress;

    PLOG_INFO << "Starting " << strategy_->name() << " download: " << url << " -> " << request.artifactName;

    std::string location;
    if (!strategy_->transfer(request, location, outError))
    {
        if (outError.message.empty())
        {
            outError.message = messages::kDownloadFailed;
        }
        return false;
    }

    outLocation = std::move(location);
    return true;
}

const char* ArtifactDownloader::strategyName() const { return strategy_ ? strategy_->name() : "none"; }

} // namespace updater
