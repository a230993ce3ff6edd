#pragma once

#include <memory>
#include <string>

namespace updater
{
class UpdaterService;
}

// Command line host that embeds the update pipeline
class Application
{
public:
    enum class Mode
    {
        Check,
        Install,
        Watch,
        PrintVersion,
        Help
    };

    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    bool parseCommandLineArgs();
    bool initializeLogging();
    bool initializeUpdater();

    int runCheck();
    int runInstall();
    int runWatch();
    void reportNoUpdate();
    void printUsage() const;

    void cleanup();

    int argc_;
    char** argv_;

    Mode mode_ = Mode::Check;
    std::string config_path_ = "config.toml";
    int watch_interval_minutes_ = 0; // 0 uses check_interval_minutes from the config

    std::unique_ptr<updater::UpdaterService> updater_service_;
};
