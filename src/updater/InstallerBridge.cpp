#include "InstallerBridge.hpp"
#include "platform/ProcessUtils.hpp"

#include <plog/Log.h>

namespace updater
{

namespace
{

constexpr const char* kArtifactPlaceholder = "{artifact}";

std::string replaceAll(std::string str, const std::string& from, const std::string& to)
{
    size_t start_pos = 0;
    while ((start_pos = str.find(from, start_pos)) != std::string::npos)
    {
        str.replace(start_pos, from.length(), to);
        start_pos += to.length();
    }
    return str;
}

} // namespace

CommandInstallerBridge::CommandInstallerBridge(std::vector<std::string> command, bool waitForExit)
    : command_(std::move(command))
    , waitForExit_(waitForExit)
{
}

std::vector<std::string> CommandInstallerBridge::expandArguments(const std::string& location) const
{
    std::vector<std::string> args;
    bool substituted = false;
    for (size_t i = 1; i < command_.size(); ++i)
    {
        if (command_[i].find(kArtifactPlaceholder) != std::string::npos)
        {
            substituted = true;
        }
        args.push_back(replaceAll(command_[i], kArtifactPlaceholder, location));
    }
    if (!substituted)
    {
        args.push_back(location);
    }
    return args;
}

bool CommandInstallerBridge::installPackage(const std::string& location, UpdateError& outError)
{
    if (command_.empty())
    {
        outError = UpdateError(UpdateErrorKind::Installer, "No installer is configured.", "installer_command is empty",
                               0);
        return false;
    }

    auto program = utils::ProcessUtils::FindExecutable(command_.front());
    if (program.empty())
    {
        outError = UpdateError(UpdateErrorKind::Installer, "Could not start the installer.",
                               "Installer program not found: " + command_.front(), 0);
        return false;
    }

    PLOG_INFO << "Starting installer " << program.string() << " for " << location;

    int exitCode = 0;
    if (!utils::ProcessUtils::LaunchProcess(program, expandArguments(location), !waitForExit_, &exitCode))
    {
        outError = UpdateError(UpdateErrorKind::Installer, "Could not start the installer.",
                               "Failed to launch " + program.string(), 0);
        return false;
    }

    if (waitForExit_ && exitCode != 0)
    {
        outError = UpdateError(UpdateErrorKind::Installer,
                               "The installer reported an error (exit code " + std::to_string(exitCode) + ").",
                               program.string() + " exited with " + std::to_string(exitCode), exitCode);
        return false;
    }

    return true;
}

std::shared_ptr<IInstallerBridge> resolveInstallerBridge(const platform::PlatformCapabilities& caps,
                                                         const UpdaterConfig& config)
{
    if (!caps.installerAvailable || config.installerCommand.empty())
    {
        PLOG_INFO << "No installer on " << caps.platformName << "; downloaded artifacts are left in the cache";
        return nullptr;
    }
    return std::make_shared<CommandInstallerBridge>(config.installerCommand, config.waitForInstaller);
}

InstallerInvoker::InstallerInvoker(std::shared_ptr<IInstallerBridge> bridge)
    : bridge_(std::move(bridge))
{
}

bool InstallerInvoker::install(const std::string& location, UpdateError& outError)
{
    if (!bridge_)
    {
        PLOG_DEBUG << "Install skipped, platform has no installer: " << location;
        return true;
    }

    if (!bridge_->installPackage(location, outError))
    {
        PLOG_ERROR << "Failed to install update: " << outError.message
                   << (outError.technicalInfo.empty() ? "" : " (" + outError.technicalInfo + ")");
        return false;
    }

    PLOG_INFO << "Installer started for " << location;
    return true;
}

} // namespace updater
