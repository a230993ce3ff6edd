#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <utility>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

constexpr std::array<std::pair<const char*, plog::Severity>, 7> kLevelNames{ {
    { "none", plog::none },
    { "fatal", plog::fatal },
    { "error", plog::error },
    { "warning", plog::warning },
    { "info", plog::info },
    { "debug", plog::debug },
    { "verbose", plog::verbose },
} };

void reportBadSetting(const std::string& key, const std::string& details)
{
    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid logging setting: logging." + key,
                                 details);
}

// Level as a name ("debug") or as plog's numeric severity 0..6
bool parseLevel(const toml::node& node, plog::Severity& out)
{
    if (auto name = node.value<std::string>())
    {
        for (const auto& [levelName, severity] : kLevelNames)
        {
            if (*name == levelName)
            {
                out = severity;
                return true;
            }
        }
        return false;
    }

    if (auto number = node.value<int64_t>())
    {
        if (*number >= plog::none && *number <= plog::verbose)
        {
            out = static_cast<plog::Severity>(*number);
            return true;
        }
    }
    return false;
}

} // namespace

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogManager::Settings LogManager::LoadSettings(const std::string& configPath)
{
    Settings settings;

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec))
        return settings;

    toml::table root;
    try
    {
        root = toml::parse_file(configPath);
    }
    catch (const toml::parse_error& e)
    {
        // The updater config loader reports the same file in detail
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Failed to read logging settings",
                                     std::string(e.description()));
        return settings;
    }

    const toml::table* section = root["logging"].as_table();
    if (!section)
        return settings;

    if (const toml::node* node = section->get("file"))
    {
        auto file = node->value<std::string>();
        if (file && !file->empty())
            settings.file = *file;
        else
            reportBadSetting("file", "expected a non-empty string");
    }

    if (const toml::node* node = section->get("level"))
    {
        if (!parseLevel(*node, settings.level))
            reportBadSetting("level", "expected none|fatal|error|warning|info|debug|verbose or 0..6");
    }

    if (const toml::node* node = section->get("append"))
    {
        if (auto append = node->value<bool>())
            settings.append = *append;
        else
            reportBadSetting("append", "expected a boolean");
    }

    if (const toml::node* node = section->get("max_file_size_kb"))
    {
        auto kb = node->value<int64_t>();
        if (kb && *kb > 0)
            settings.maxFileSize = static_cast<std::size_t>(*kb) * 1024;
        else
            reportBadSetting("max_file_size_kb", "expected a positive integer");
    }

    if (const toml::node* node = section->get("backup_count"))
    {
        auto count = node->value<int64_t>();
        if (count && *count >= 0)
            settings.backupCount = static_cast<int>(*count);
        else
            reportBadSetting("backup_count", "expected a non-negative integer");
    }

    return settings;
}

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    try
    {
        std::filesystem::path file(settings.file);
        if (file.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(file.parent_path(), ec);
            if (ec)
            {
                ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                           file.parent_path().string() + ": " + ec.message());
                return false;
            }
        }

        if (!settings.append)
        {
            std::ofstream(settings.file, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.maxFileSize, settings.backupCount);
        plog::init(settings.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize logging", ex.what());
        return false;
    }

    s_initialized = true;
    PLOG_INFO << "Logging to " << settings.file << " at level " << plog::severityToString(settings.level);
    return true;
}

} // namespace utils
