#include "UpdaterConfig.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <fstream>
#include <limits>

namespace updater
{

namespace
{

bool readString(const toml::table& section, const char* key, std::string& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (auto value = node->value<std::string>())
    {
        out = *value;
        return true;
    }
    outError = std::string("updater.") + key + " must be a string";
    return false;
}

bool readInt(const toml::table& section, const char* key, int& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (!node->is_integer())
    {
        outError = std::string("updater.") + key + " must be an integer";
        return false;
    }
    auto value = node->value<int64_t>();
    if (!value || *value <= 0 || *value > std::numeric_limits<int>::max())
    {
        outError = std::string("updater.") + key + " must be a positive integer";
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}

bool readBool(const toml::table& section, const char* key, bool& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (auto value = node->value<bool>())
    {
        out = *value;
        return true;
    }
    outError = std::string("updater.") + key + " must be a boolean";
    return false;
}

} // namespace

std::vector<std::string> UpdaterConfig::defaultInstallerCommand()
{
#if defined(__linux__)
    // Hands the package to the desktop's software installer
    return { "xdg-open", "{artifact}" };
#else
    return {};
#endif
}

bool UpdaterConfig::fromTable(const toml::table& section, UpdaterConfig& outConfig, std::string& outError)
{
    UpdaterConfig cfg = outConfig;

    if (!readString(section, "manifest_url", cfg.manifestUrl, outError) ||
        !readInt(section, "check_interval_minutes", cfg.checkIntervalMinutes, outError) ||
        !readString(section, "user_agent", cfg.userAgent, outError) ||
        !readInt(section, "manifest_timeout_ms", cfg.manifestTimeoutMs, outError) ||
        !readInt(section, "connect_timeout_ms", cfg.connectTimeoutMs, outError) ||
        !readInt(section, "download_timeout_ms", cfg.downloadTimeoutMs, outError) ||
        !readString(section, "cache_dir", cfg.cacheDir, outError) ||
        !readString(section, "artifact_extension", cfg.artifactExtension, outError) ||
        !readBool(section, "streaming_download", cfg.streamingDownload, outError) ||
        !readBool(section, "force_enable", cfg.forceEnable, outError) ||
        !readBool(section, "wait_for_installer", cfg.waitForInstaller, outError))
    {
        return false;
    }

    if (const toml::node* node = section.get("installer_command"))
    {
        const toml::array* arr = node->as_array();
        if (!arr)
        {
            outError = "updater.installer_command must be an array of strings";
            return false;
        }

        std::vector<std::string> command;
        for (const auto& element : *arr)
        {
            auto value = element.value<std::string>();
            if (!value)
            {
                outError = "updater.installer_command must be an array of strings";
                return false;
            }
            command.push_back(*value);
        }
        cfg.installerCommand = std::move(command);
    }

    if (!cfg.validate(outError))
    {
        return false;
    }

    outConfig = std::move(cfg);
    return true;
}

bool UpdaterConfig::loadFile(const std::string& path, UpdaterConfig& outConfig, std::string& outError)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config at " << path << ", using updater defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse(ifs, path);
        const toml::table* section = root["updater"].as_table();
        if (!section)
        {
            return true;
        }
        if (!fromTable(*section, outConfig, outError))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Updater settings are invalid. Using defaults.",
                                                outError + "\nFile: " + path);
            return false;
        }
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;
        }
        outError = "config parse error: " + details;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using updater defaults.",
                                            details + "\nFile: " + path);
        return false;
    }
}

bool UpdaterConfig::validate(std::string& outError) const
{
    if (manifestUrl.empty())
    {
        outError = "updater.manifest_url is empty";
        return false;
    }

    if (manifestUrl.rfind("http://", 0) != 0 && manifestUrl.rfind("https://", 0) != 0)
    {
        outError = "updater.manifest_url must be an http(s) URL";
        return false;
    }

    if (checkIntervalMinutes <= 0 || manifestTimeoutMs <= 0 || connectTimeoutMs <= 0 || downloadTimeoutMs <= 0)
    {
        outError = "updater intervals and timeouts must be positive";
        return false;
    }

    if (!artifactExtension.empty() && artifactExtension.find_first_of("/\\") != std::string::npos)
    {
        outError = "updater.artifact_extension must not contain path separators";
        return false;
    }

    return true;
}

} // namespace updater
