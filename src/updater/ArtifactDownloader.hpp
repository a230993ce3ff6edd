#pragma once

#include "ProgressEvents.hpp"
#include "ScratchStorage.hpp"
#include "TransferStrategy.hpp"
#include "platform/PlatformCapabilities.hpp"

#include <memory>
#include <string>

namespace updater
{

// Picks the transfer strategy for this process from its capabilities
std::unique_ptr<ITransferStrategy> createTransferStrategy(const platform::PlatformCapabilities& caps,
                                                          std::shared_ptr<utils::IHttpClient> http,
                                                          const ScratchStorage& storage,
                                                          std::shared_ptr<IProgressEvents> events,
                                                          utils::SessionConfig session);

// Downloads release artifacts into scratch storage
class ArtifactDownloader
{
public:
    ArtifactDownloader(bool platformSupported, std::unique_ptr<ITransferStrategy> strategy, ScratchStorage storage,
                       std::string artifactExtension);
    ~ArtifactDownloader();

    ArtifactDownloader(const ArtifactDownloader&) = delete;
    ArtifactDownloader& operator=(const ArtifactDownloader&) = delete;

    // Blocking. Safe to call concurrently; every call stages into its own file.
    bool download(const std::string& url, const DownloadProgressCallback& onProgress, std::string& outLocation,
                  UpdateError& outError);

    const char* strategyName() const;
    const ScratchStorage& storage() const { return storage_; }

private:
    bool platformSupported_;
    std::unique_ptr<ITransferStrategy> strategy_;
    ScratchStorage storage_;
    std::string artifactExtension_;
};

} // namespace updater
