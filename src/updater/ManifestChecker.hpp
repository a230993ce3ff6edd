#pragma once

#include "UpdateTypes.hpp"
#include "utils/HttpCommon.hpp"

#include <memory>
#include <string>

namespace updater
{

// Release manifest client
class ManifestChecker
{
public:
    ManifestChecker(std::shared_ptr<utils::IHttpClient> http, std::string manifestUrl, utils::SessionConfig session);
    ~ManifestChecker();

    // Fetch and parse the manifest (blocking)
    // Returns false on transport failure, non-2xx status or malformed body
    bool fetchManifest(UpdateInfo& outInfo, std::string& outError);

    // Fetch, parse and compare against the running build (blocking)
    // Returns true only when a newer release exists; outError stays empty
    // when the check succeeded but the build is up to date
    bool checkLatestRelease(const VersionDescriptor& currentVersion, UpdateInfo& outInfo, std::string& outError);

    const std::string& manifestUrl() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
