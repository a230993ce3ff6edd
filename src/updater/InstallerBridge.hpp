#pragma once

#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"
#include "platform/PlatformCapabilities.hpp"

#include <memory>
#include <string>
#include <vector>

namespace updater
{

// Hands a staged artifact to the operating system's install flow
class IInstallerBridge
{
public:
    virtual ~IInstallerBridge() = default;

    virtual bool installPackage(const std::string& location, UpdateError& outError) = 0;
};

// Runs a configured installer program; "{artifact}" in any argument is
// replaced by the artifact location, otherwise the location is appended
class CommandInstallerBridge final : public IInstallerBridge
{
public:
    CommandInstallerBridge(std::vector<std::string> command, bool waitForExit);

    bool installPackage(const std::string& location, UpdateError& outError) override;

    std::vector<std::string> expandArguments(const std::string& location) const;

private:
    std::vector<std::string> command_;
    bool waitForExit_;
};

// Resolved once at startup. Returns null when the platform has no installer.
std::shared_ptr<IInstallerBridge> resolveInstallerBridge(const platform::PlatformCapabilities& caps,
                                                         const UpdaterConfig& config);

class InstallerInvoker
{
public:
    explicit InstallerInvoker(std::shared_ptr<IInstallerBridge> bridge);

    // No bridge: succeeds without doing anything. Bridge failures are
    // returned exactly as the bridge reported them.
    bool install(const std::string& location, UpdateError& outError);

    bool hasInstaller() const { return bridge_ != nullptr; }

private:
    std::shared_ptr<IInstallerBridge> bridge_;
};

} // namespace updater
