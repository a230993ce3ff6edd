#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Process-wide plog setup for the updater host
class LogManager
{
public:
    // [logging] table of config.toml
    struct Settings
    {
        std::string file = "logs/appupdate.log";
        plog::Severity level = plog::info;
        bool append = true;
        std::size_t maxFileSize = 10 * 1024 * 1024;
        int backupCount = 3;
        bool console = false; // Not read from the file; set by the host
    };

    // A missing file or table keeps the defaults. Malformed values are
    // reported as configuration warnings and skipped.
    static Settings LoadSettings(const std::string& configPath);

    // Installs the rolling file appender (and console appender) on the
    // default logger; the appenders live until process exit. Subsequent
    // calls are no-ops.
    static bool Initialize(const Settings& settings);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
