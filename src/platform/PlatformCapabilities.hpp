#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace platform
{

// What this process may do with updates. Detected once at startup and
// passed by value; nothing re-probes the platform per call.
struct PlatformCapabilities
{
    bool canInstallUpdates = false; // Packaged release build (or forced)
    bool streamingDownload = false; // Direct-to-storage transfers available
    bool installerAvailable = false; // Platform installer command resolvable
    std::string platformName;

    // Inputs that feed detection
    struct Probe
    {
        std::vector<std::filesystem::path> markerDirectories; // Where to look for manifest.json
        bool forceEnable = false;
        bool streamingDownload = true;
        std::vector<std::string> installerCommand;
    };

    static PlatformCapabilities Detect(const Probe& probe);

    // Directories a packaged build keeps its manifest.json in
    static std::vector<std::filesystem::path> DefaultMarkerDirectories();

    // True when dir/manifest.json exists and declares "is_release": true
    static bool IsPackagedBuild(const std::filesystem::path& dir);

    static const char* CurrentPlatformName();
};

} // namespace platform
