#pragma once

#include "InstallerBridge.hpp"
#include "ProgressEvents.hpp"
#include "UpdateTypes.hpp"
#include "UpdaterConfig.hpp"
#include "platform/PlatformCapabilities.hpp"
#include "utils/HttpCommon.hpp"

#include <filesystem>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace updater
{

// Callback types
using UpdateCheckCallback = std::function<void(const std::optional<UpdateInfo>& update)>;
using UpdateAvailableCallback = std::function<void(const UpdateInfo& update)>;
using InstallCompleteCallback = std::function<void(bool success, const UpdateError& error)>;

// Collaborators the service does not own the choice of. Empty members get
// the production implementation.
struct UpdaterDependencies
{
    std::shared_ptr<utils::IHttpClient> http; // CprHttpClient with the configured user agent
    std::shared_ptr<IInstallerBridge> installer; // Null: platform has no installer
    std::shared_ptr<IProgressEvents> progressEvents; // ProgressEventHub when streaming is available
    std::optional<std::filesystem::path> cacheRoot; // Overrides cache_dir and the platform default
};

// Main updater service
class UpdaterService
{
public:
    UpdaterService();
    ~UpdaterService();

    // Disable copy
    UpdaterService(const UpdaterService&) = delete;
    UpdaterService& operator=(const UpdaterService&) = delete;

    // Wires the pipeline. Fails only on invalid configuration; a platform
    // that cannot install updates still initializes and turns every
    // operation into a no-op.
    bool initialize(const UpdaterConfig& config, const VersionDescriptor& currentVersion,
                    const platform::PlatformCapabilities& capabilities, UpdaterDependencies deps = {});

    // Disarms scheduled checks and waits for async operations
    void shutdown();

    // Fetches the manifest and returns it only when it describes a newer
    // release (blocking). Manifest failures are logged and yield nullopt.
    std::optional<UpdateInfo> checkForUpdates();
    void checkForUpdatesAsync(UpdateCheckCallback callback);

    // Downloads url into scratch storage and hands it to the installer (blocking)
    bool downloadAndInstall(const std::string& url, const DownloadProgressCallback& onProgress,
                            UpdateError& outError);
    void downloadAndInstallAsync(const std::string& url, DownloadProgressCallback onProgress,
                                 InstallCompleteCallback onComplete);

    VersionDescriptor getCurrentVersion() const;

    // One check now, then every intervalMinutes until shutdown. A tick is
    // skipped while another check is still running.
    bool scheduleUpdateChecks(int intervalMinutes = 60);
    void setUpdateAvailableCallback(UpdateAvailableCallback callback);
    bool isScheduled() const;

    bool isBroadcastVisible(std::optional<std::int64_t> broadcastCode) const;

    // Last failure of the most recent check or download; empty after a success
    UpdateError getLastError() const;

    // Async operations started and not yet joined
    std::size_t pendingWorkerCount() const;

    bool isInitialized() const;
    bool canInstallUpdates() const;

private:
    void recordError(const UpdateError& error);
    void clearLastError();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater

updater::UpdaterService* UpdaterService_Get();
void UpdaterService_Set(updater::UpdaterService* service);
