#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace updater
{

// Running build identity, compared by code only
struct VersionDescriptor
{
    std::string name; // e.g., "1.1.0"
    std::int64_t code; // Monotonic release number

    VersionDescriptor()
        : code(0)
    {
    }

    VersionDescriptor(std::string n, std::int64_t c)
        : name(std::move(n))
        , code(c)
    {
    }
};

// Parsed release manifest
struct UpdateInfo
{
    std::string version; // Informational, e.g., "1.2.0"
    std::int64_t versionCode; // Compared against VersionDescriptor::code
    std::string downloadUrl; // Absolute artifact URL
    std::string changelog;
    bool mandatory;
    std::string releaseDate; // ISO 8601 date
    std::optional<std::string> minVersion; // Informational only

    UpdateInfo()
        : versionCode(0)
        , mandatory(false)
    {
    }
};

// Raw transfer progress, scoped to one artifact name
struct TransferProgress
{
    std::string artifactName;
    std::uint64_t bytesTransferred;
    std::uint64_t totalBytes; // 0 when the server did not announce a length

    TransferProgress()
        : bytesTransferred(0)
        , totalBytes(0)
    {
    }

    TransferProgress(std::string name, std::uint64_t now, std::uint64_t total)
        : artifactName(std::move(name))
        , bytesTransferred(now)
        , totalBytes(total)
    {
    }
};

enum class UpdateErrorKind
{
    None,
    UnsupportedPlatform, // Capability gate refused the operation
    Manifest, // Manifest unreachable or malformed
    HttpStatus, // Artifact server answered with a non-2xx status
    Network, // Transport-level failure
    Timeout, // Transfer exceeded its deadline
    ConversionFailed, // Buffered payload could not be encoded
    Storage, // Scratch storage could not be written or resolved
    Installer // Platform installer refused the artifact
};

// Error information for failed updates
struct UpdateError
{
    std::string message; // Human-readable error message
    std::string technicalInfo; // Technical details for logging
    int errorCode; // HTTP status, exit status or errno
    UpdateErrorKind kind;

    UpdateError()
        : errorCode(0)
        , kind(UpdateErrorKind::None)
    {
    }

    UpdateError(UpdateErrorKind k, const std::string& msg)
        : message(msg)
        , errorCode(0)
        , kind(k)
    {
    }

    UpdateError(UpdateErrorKind k, const std::string& msg, const std::string& tech, int code)
        : message(msg)
        , technicalInfo(tech)
        , errorCode(code)
        , kind(k)
    {
    }

    bool empty() const { return kind == UpdateErrorKind::None && message.empty(); }
};

// Percentage 0..100, only reported when the total size is known
using DownloadProgressCallback = std::function<void(float percentage)>;

const char* ErrorKindToString(UpdateErrorKind kind);

} // namespace updater
