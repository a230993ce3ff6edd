#include "Version.hpp"

#ifndef APPUPDATE_VERSION_NAME
#define APPUPDATE_VERSION_NAME "0.0.0"
#endif

#ifndef APPUPDATE_VERSION_CODE
#define APPUPDATE_VERSION_CODE 0
#endif

namespace updater
{

bool isNewer(std::int64_t manifestCode, std::int64_t currentCode) { return manifestCode > currentCode; }

bool isBroadcastVisible(std::optional<std::int64_t> broadcastCode, const VersionDescriptor& current)
{
    if (!broadcastCode)
    {
        return true;
    }
    return !isNewer(*broadcastCode, current.code);
}

VersionDescriptor currentBuildVersion()
{
    return VersionDescriptor(APPUPDATE_VERSION_NAME, static_cast<std::int64_t>(APPUPDATE_VERSION_CODE));
}

const char* ErrorKindToString(UpdateErrorKind kind)
{
    switch (kind)
    {
    case UpdateErrorKind::None:
        return "None";
    case UpdateErrorKind::UnsupportedPlatform:
        return "UnsupportedPlatform";
    case UpdateErrorKind::Manifest:
        return "Manifest";
    case UpdateErrorKind::HttpStatus:
        return "HttpStatus";
    case UpdateErrorKind::Network:
        return "Network";
    case UpdateErrorKind::Timeout:
        return "Timeout";
    case UpdateErrorKind::ConversionFailed:
        return "ConversionFailed";
    case UpdateErrorKind::Storage:
        return "Storage";
    case UpdateErrorKind::Installer:
        return "Installer";
    default:
        return "Unknown";
    }
}

} // namespace updater
