#include "app/Application.hpp"
#include "platform/PlatformCapabilities.hpp"
#include "updater/InstallerBridge.hpp"
#include "updater/UpdaterConfig.hpp"
#include "updater/UpdaterService.hpp"
#include "updater/Version.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace
{

std::atomic<bool> g_exit_requested{ false };

void HandleSignal(int) { g_exit_requested = true; }

bool ParsePositiveInt(const char* text, int& out)
{
    try
    {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != std::strlen(text) || value <= 0)
        {
            return false;
        }
        out = value;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

void PrintPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(report.severity) << "] " << report.user_message;
        if (!report.technical_details.empty())
        {
            std::cerr << " (" << report.technical_details << ")";
        }
        std::cerr << "\n";
    }
}

void PrintUpdate(const updater::UpdateInfo& info)
{
    std::cout << "Update available: " << info.version << " (code " << info.versionCode << ")"
              << (info.mandatory ? " [mandatory]" : "") << "\n";
    if (!info.releaseDate.empty())
    {
        std::cout << "Released: " << info.releaseDate << "\n";
    }
    if (info.minVersion)
    {
        std::cout << "Minimum version: " << *info.minVersion << "\n";
    }
    if (!info.changelog.empty())
    {
        std::cout << "\n" << info.changelog << "\n";
    }
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return 2;
    }

    if (mode_ == Mode::Help)
    {
        printUsage();
        return 0;
    }

    if (mode_ == Mode::PrintVersion)
    {
        auto version = updater::currentBuildVersion();
        std::cout << version.name << " (code " << version.code << ")\n";
        return 0;
    }

    if (!initializeLogging())
    {
        PrintPendingErrors();
        return 1;
    }

    if (!initializeUpdater())
    {
        PrintPendingErrors();
        return 1;
    }

    int result = 0;
    switch (mode_)
    {
    case Mode::Install:
        result = runInstall();
        break;
    case Mode::Watch:
        result = runWatch();
        break;
    default:
        result = runCheck();
        break;
    }

    cleanup();
    return result;
}

void Application::requestExit() { g_exit_requested = true; }

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        std::string arg = argv_[i];
        if (arg == "--config")
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "--config requires a path\n";
                return false;
            }
            config_path_ = argv_[++i];
        }
        else if (arg == "--check")
        {
            mode_ = Mode::Check;
        }
        else if (arg == "--install")
        {
            mode_ = Mode::Install;
        }
        else if (arg == "--watch")
        {
            mode_ = Mode::Watch;
            if (i + 1 < argc_ && argv_[i + 1][0] != '-')
            {
                if (!ParsePositiveInt(argv_[i + 1], watch_interval_minutes_))
                {
                    std::cerr << "--watch expects a positive number of minutes\n";
                    return false;
                }
                ++i;
            }
        }
        else if (arg == "--version")
        {
            mode_ = Mode::PrintVersion;
        }
        else if (arg == "--help" || arg == "-h")
        {
            mode_ = Mode::Help;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

bool Application::initializeLogging()
{
    auto settings = utils::LogManager::LoadSettings(config_path_);
    settings.console = mode_ == Mode::Watch;
    return utils::LogManager::Initialize(settings);
}

bool Application::initializeUpdater()
{
    updater::UpdaterConfig config;
    std::string error;
    if (!updater::UpdaterConfig::loadFile(config_path_, config, error))
    {
        return false;
    }

    platform::PlatformCapabilities::Probe probe;
    probe.markerDirectories = platform::PlatformCapabilities::DefaultMarkerDirectories();
    probe.forceEnable = config.forceEnable;
    probe.streamingDownload = config.streamingDownload;
    probe.installerCommand = config.installerCommand;
    auto caps = platform::PlatformCapabilities::Detect(probe);

    updater::UpdaterDependencies deps;
    deps.installer = updater::resolveInstallerBridge(caps, config);

    updater_service_ = std::make_unique<updater::UpdaterService>();
    if (!updater_service_->initialize(config, updater::currentBuildVersion(), caps, std::move(deps)))
    {
        updater_service_.reset();
        return false;
    }
    UpdaterService_Set(updater_service_.get());

    if (watch_interval_minutes_ == 0)
    {
        watch_interval_minutes_ = config.checkIntervalMinutes;
    }
    return true;
}

int Application::runCheck()
{
    if (!updater_service_->canInstallUpdates())
    {
        std::cout << "Updates are not available for this build.\n";
        return 0;
    }

    auto update = updater_service_->checkForUpdates();
    if (update)
    {
        PrintUpdate(*update);
        return 0;
    }

    reportNoUpdate();
    return 0;
}

void Application::reportNoUpdate()
{
    auto error = updater_service_->getLastError();
    if (error.kind == updater::UpdateErrorKind::Manifest)
    {
        std::cout << error.message << "\n";
        PrintPendingErrors();
        return;
    }

    auto version = updater_service_->getCurrentVersion();
    std::cout << "Up to date (" << version.name << ", code " << version.code << ")\n";
}

int Application::runInstall()
{
    if (!updater_service_->canInstallUpdates())
    {
        std::cout << "Updates are not available for this build.\n";
        return 0;
    }

    auto update = updater_service_->checkForUpdates();
    if (!update)
    {
        reportNoUpdate();
        return 0;
    }

    PrintUpdate(*update);

    updater::UpdateError error;
    bool ok = updater_service_->downloadAndInstall(
        update->downloadUrl,
        [](float percentage)
        {
            std::printf("\rDownloading... %5.1f%%", static_cast<double>(percentage));
            std::fflush(stdout);
        },
        error);
    std::cout << "\n";

    if (!ok)
    {
        std::cerr << "Update failed: " << error.message << "\n";
        if (!error.technicalInfo.empty())
        {
            std::cerr << "  " << error.technicalInfo << "\n";
        }
        return 1;
    }

    std::cout << "Installer started for " << update->version << "\n";
    return 0;
}

int Application::runWatch()
{
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    updater_service_->setUpdateAvailableCallback(
        [](const updater::UpdateInfo& info)
        {
            PLOG_INFO << "Update " << info.version << " (code " << info.versionCode << ") is available"
                      << (info.mandatory ? ", mandatory" : "");
        });

    if (!updater_service_->scheduleUpdateChecks(watch_interval_minutes_))
    {
        return 1;
    }

    while (!g_exit_requested)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    PLOG_INFO << "Exit requested";
    return 0;
}

void Application::printUsage() const
{
    std::cout << "Usage: appupdate [--config <path>] [--check | --install | --watch [minutes]] [--version]\n"
              << "  --check            report whether a newer release exists (default)\n"
              << "  --install          download the newer release and start its installer\n"
              << "  --watch [minutes]  check now and then periodically until interrupted\n"
              << "  --version          print the running version\n";
}

void Application::cleanup()
{
    if (updater_service_)
    {
        updater_service_->shutdown();
        UpdaterService_Set(nullptr);
        updater_service_.reset();
    }
}
