#pragma once

#include "UpdateTypes.hpp"
#include "utils/HttpCommon.hpp"

#include <cstdint>
#include <string>

namespace updater
{

namespace messages
{
inline constexpr const char* kUnsupportedPlatform = "Updates are only available on supported platforms.";
inline constexpr const char* kNetworkError = "Network error during download. Check your connection.";
inline constexpr const char* kTimeout = "The download timed out.";
inline constexpr const char* kConversionFailed = "File conversion failed (out of memory?)";
inline constexpr const char* kDownloadFailed = "Download failed";
} // namespace messages

struct TransferRequest
{
    std::string url;
    std::string artifactName; // Unique per attempt, synthesized by the engine
    DownloadProgressCallback onProgress; // May be empty
};

// One way of moving an artifact from a URL into scratch storage
class ITransferStrategy
{
public:
    virtual ~ITransferStrategy() = default;

    virtual const char* name() const = 0;

    // Exactly one outcome: true with outLocation set, or false with outError set
    virtual bool transfer(const TransferRequest& request, std::string& outLocation, UpdateError& outError) = 0;
};

// 0..100, clamped; callers only report when total > 0
float toPercentage(std::uint64_t bytesNow, std::uint64_t bytesTotal);

// Maps a failed response to its user-facing transfer error:
// "Download failed (Status: N)", network failure, or timeout
UpdateError transferErrorFromResponse(const utils::HttpResponse& response);

} // namespace updater
