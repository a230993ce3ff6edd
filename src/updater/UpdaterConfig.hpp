#pragma once

#include <string>
#include <vector>

#include <toml++/toml.h>

namespace updater
{

// [updater] section of config.toml
struct UpdaterConfig
{
    std::string manifestUrl = "https://updates.example.com/app/version.json";
    int checkIntervalMinutes = 60;
    std::string userAgent = "AppUpdate-Updater";

    int manifestTimeoutMs = 5000;
    int connectTimeoutMs = 10000;
    int downloadTimeoutMs = 600000;

    std::string cacheDir; // Empty selects the platform cache directory
    std::string artifactExtension = ".bin";
    bool streamingDownload = true;
    bool forceEnable = false; // Treat a development build as installable

    // argv of the platform installer; "{artifact}" is replaced by the artifact location
    std::vector<std::string> installerCommand = defaultInstallerCommand();
    bool waitForInstaller = false;

    static std::vector<std::string> defaultInstallerCommand();

    // Missing keys keep their defaults; invalid values are rejected
    static bool fromTable(const toml::table& section, UpdaterConfig& outConfig, std::string& outError);

    // A missing file is not an error
    static bool loadFile(const std::string& path, UpdaterConfig& outConfig, std::string& outError);

    bool validate(std::string& outError) const;
};

} // namespace updater
