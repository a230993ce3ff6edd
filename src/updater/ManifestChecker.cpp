#include "ManifestChecker.hpp"
#include "ManifestParser.hpp"
#include "Version.hpp"

#include <plog/Log.h>

namespace updater
{

struct ManifestChecker::Impl
{
    std::shared_ptr<utils::IHttpClient> http;
    std::string manifestUrl;
    utils::SessionConfig session;
    ManifestParser parser;

    Impl(std::shared_ptr<utils::IHttpClient> h, std::string url, utils::SessionConfig s)
        : http(std::move(h))
        , manifestUrl(std::move(url))
        , session(s)
    {
    }
};

ManifestChecker::ManifestChecker(std::shared_ptr<utils::IHttpClient> http, std::string manifestUrl,
                                 utils::SessionConfig session)
    : impl_(std::make_unique<Impl>(std::move(http), std::move(manifestUrl), session))
{
}

ManifestChecker::~ManifestChecker() = default;

bool ManifestChecker::fetchManifest(UpdateInfo& outInfo, std::string& outError)
{
    if (!impl_->http)
    {
        outError = "No HTTP transport configured";
        PLOG_ERROR << outError;
        return false;
    }

    PLOG_INFO << "Checking for updates: " << impl_->manifestUrl;

    utils::HttpResponse response;
    try
    {
        response = impl_->http->get(impl_->manifestUrl, { { "Accept", "application/json" } }, impl_->session);
    }
    catch (const std::exception& e)
    {
        outError = std::string("Network error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }

    if (!response.error.empty())
    {
        outError = std::string(response.timedOut() ? "Update check timed out: " : "Network error: ") + response.error;
        PLOG_ERROR << outError;
        return false;
    }

    if (!response.ok())
    {
        outError = "Update check returned status " + std::to_string(response.status_code);
        if (response.status_code == 404)
        {
            outError += " (manifest not found)";
        }
        PLOG_ERROR << outError;
        return false;
    }

    if (!impl_->parser.parse(response.text, outInfo, outError))
    {
        PLOG_ERROR << "Invalid update manifest: " << outError;
        return false;
    }

    return true;
}

bool ManifestChecker::checkLatestRelease(const VersionDescriptor& currentVersion, UpdateInfo& outInfo,
                                         std::string& outError)
{
    UpdateInfo info;
    if (!fetchManifest(info, outError))
    {
        return false;
    }

    if (!isNewer(info.versionCode, currentVersion.code))
    {
        PLOG_INFO << "Current version " << currentVersion.name << " (" << currentVersion.code
                  << ") is up to date (latest: " << info.version << ", code " << info.versionCode << ")";
        return false;
    }

    PLOG_INFO << "New version available: " << info.version << " (code " << info.versionCode << ", current "
              << currentVersion.code << ")" << (info.mandatory ? " [mandatory]" : "");
    PLOG_INFO << "Download URL: " << info.downloadUrl;
    outInfo = std::move(info);
    return true;
}

const std::string& ManifestChecker::manifestUrl() const { return impl_->manifestUrl; }

} // namespace updater
