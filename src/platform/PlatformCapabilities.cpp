#include "PlatformCapabilities.hpp"
#include "ProcessUtils.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <fstream>

using json = nlohmann::json;

namespace platform
{

PlatformCapabilities PlatformCapabilities::Detect(const Probe& probe)
{
    PlatformCapabilities caps;
    caps.platformName = CurrentPlatformName();
    caps.streamingDownload = probe.streamingDownload;

    if (probe.forceEnable)
    {
        PLOG_INFO << "Updater force-enabled by configuration";
        caps.canInstallUpdates = true;
    }
    else
    {
        for (const auto& dir : probe.markerDirectories)
        {
            if (IsPackagedBuild(dir))
            {
                caps.canInstallUpdates = true;
                break;
            }
        }
    }

    if (!probe.installerCommand.empty())
    {
        auto installer = utils::ProcessUtils::FindExecutable(probe.installerCommand.front());
        caps.installerAvailable = !installer.empty();
        if (!caps.installerAvailable)
        {
            PLOG_WARNING << "Installer program not found: " << probe.installerCommand.front();
        }
    }

    PLOG_INFO << "Platform " << caps.platformName << ": updates " << (caps.canInstallUpdates ? "enabled" : "disabled")
              << ", transfer " << (caps.streamingDownload ? "streaming" : "buffered") << ", installer "
              << (caps.installerAvailable ? "available" : "none");
    return caps;
}

std::vector<std::filesystem::path> PlatformCapabilities::DefaultMarkerDirectories()
{
    std::vector<std::filesystem::path> dirs;

    auto exePath = utils::ProcessUtils::GetExecutablePath();
    if (!exePath.empty())
    {
        dirs.push_back(exePath.parent_path());
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec && (dirs.empty() || dirs.front() != cwd))
    {
        dirs.push_back(cwd);
    }
    return dirs;
}

bool PlatformCapabilities::IsPackagedBuild(const std::filesystem::path& dir)
{
    std::filesystem::path manifestPath = dir / "manifest.json";
    std::error_code ec;
    if (!std::filesystem::exists(manifestPath, ec))
    {
        return false;
    }

    std::ifstream manifestFile(manifestPath);
    if (!manifestFile.is_open())
    {
        return false;
    }

    try
    {
        json manifest = json::parse(manifestFile);
        return manifest.is_object() && manifest.value("is_release", false);
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING << "Unreadable build manifest " << manifestPath.string() << ": " << e.what();
        return false;
    }
}

const char* PlatformCapabilities::CurrentPlatformName()
{
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

} // namespace platform
