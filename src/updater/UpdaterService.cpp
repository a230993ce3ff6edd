#include "UpdaterService.hpp"
#include "ArtifactDownloader.hpp"
#include "ManifestChecker.hpp"
#include "UpdateScheduler.hpp"
#include "Version.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace updater
{

namespace
{

constexpr int kDefaultIntervalMinutes = 60;
constexpr const char* kAppName = "appupdate";
constexpr const char* kCheckFailedMessage = "Could not check for updates.";

class InFlightGuard
{
public:
    explicit InFlightGuard(std::atomic<int>& counter)
        : counter_(counter)
    {
        ++counter_;
    }

    ~InFlightGuard() { --counter_; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<int>& counter_;
};

// Async operation thread; done is set once its work has returned
struct Worker
{
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

} // namespace

struct UpdaterService::Impl
{
    UpdaterConfig config;
    VersionDescriptor currentVersion;
    platform::PlatformCapabilities capabilities;

    std::unique_ptr<ManifestChecker> checker;
    std::unique_ptr<ArtifactDownloader> downloader;
    std::unique_ptr<InstallerInvoker> installer;
    std::shared_ptr<IProgressEvents> progressEvents; // Kept alive for the streaming strategy

    UpdateScheduler scheduler;
    std::atomic<int> checksInFlight{ 0 };

    mutable std::mutex mutex;
    UpdateError lastError;
    UpdateAvailableCallback updateAvailableCallback;
    std::vector<Worker> workers;
    bool acceptingWork = false;

    std::atomic<bool> initialized{ false };

    // Joins workers whose work has returned. Caller holds mutex.
    void reapFinishedWorkers()
    {
        for (auto it = workers.begin(); it != workers.end();)
        {
            if (it->done->load() && it->thread.get_id() != std::this_thread::get_id())
            {
                it->thread.join();
                it = workers.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    // Refused once shutdown() has started joining
    bool launch(std::function<void()> work)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!acceptingWork)
        {
            return false;
        }
        reapFinishedWorkers();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread(
            [work = std::move(work), done]()
            {
                work();
                *done = true;
            });
        workers.push_back(Worker{ std::move(thread), std::move(done) });
        return true;
    }
};

UpdaterService::UpdaterService()
    : impl_(std::make_unique<Impl>())
{
}

UpdaterService::~UpdaterService() { shutdown(); }

bool UpdaterService::initialize(const UpdaterConfig& config, const VersionDescriptor& currentVersion,
                                const platform::PlatformCapabilities& capabilities, UpdaterDependencies deps)
{
    if (impl_->initialized)
    {
        PLOG_WARNING << "UpdaterService already initialized";
        return true;
    }

    std::string configError;
    if (!config.validate(configError))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Updater configuration is invalid.",
                                          configError);
        return false;
    }

    impl_->config = config;
    impl_->currentVersion = currentVersion;
    impl_->capabilities = capabilities;

    if (!deps.http)
    {
        deps.http = std::make_shared<utils::CprHttpClient>(config.userAgent);
    }
    if (!deps.progressEvents && capabilities.streamingDownload)
    {
        deps.progressEvents = std::make_shared<ProgressEventHub>();
    }
    impl_->progressEvents = deps.progressEvents;

    std::filesystem::path cacheRoot;
    if (deps.cacheRoot)
    {
        cacheRoot = *deps.cacheRoot;
    }
    else if (!config.cacheDir.empty())
    {
        cacheRoot = config.cacheDir;
    }
    else
    {
        cacheRoot = ScratchStorage::DefaultCacheRoot(kAppName);
    }
    ScratchStorage storage(cacheRoot);

    utils::SessionConfig manifestSession;
    manifestSession.connect_timeout_ms = config.connectTimeoutMs;
    manifestSession.timeout_ms = config.manifestTimeoutMs;

    utils::SessionConfig downloadSession;
    downloadSession.connect_timeout_ms = config.connectTimeoutMs;
    downloadSession.timeout_ms = config.downloadTimeoutMs;

    impl_->checker = std::make_unique<ManifestChecker>(deps.http, config.manifestUrl, manifestSession);
    impl_->downloader = std::make_unique<ArtifactDownloader>(
        capabilities.canInstallUpdates,
        createTransferStrategy(capabilities, deps.http, storage, deps.progressEvents, downloadSession), storage,
        config.artifactExtension);
    impl_->installer = std::make_unique<InstallerInvoker>(std::move(deps.installer));

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->acceptingWork = true;
    }
    impl_->initialized = true;

    if (capabilities.canInstallUpdates)
    {
        PLOG_INFO << "UpdaterService initialized on " << capabilities.platformName << " (current version: "
                  << currentVersion.name << ", code " << currentVersion.code << ", "
                  << impl_->downloader->strategyName() << " downloads, "
                  << (impl_->installer->hasInstaller() ? "installer available" : "no installer") << ")";
    }
    else
    {
        PLOG_INFO << "UpdaterService disabled: Running in development mode (manifest.json is_release=false or missing)";
        PLOG_INFO << "Set force_enable = true under [updater] to test updates from a development build";
    }
    return true;
}

void UpdaterService::shutdown()
{
    if (!impl_->initialized)
    {
        return;
    }

    PLOG_INFO << "UpdaterService shutting down";

    impl_->scheduler.stop();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->acceptingWork = false;
        workers.swap(impl_->workers);
    }

    for (auto& worker : workers)
    {
        if (!worker.thread.joinable())
        {
            continue;
        }
        // shutdown() called from a completion callback
        if (worker.thread.get_id() == std::this_thread::get_id())
        {
            worker.thread.detach();
        }
        else
        {
            worker.thread.join();
        }
    }

    impl_->initialized = false;
}

std::optional<UpdateInfo> UpdaterService::checkForUpdates()
{
    if (!impl_->initialized)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        return std::nullopt;
    }

    if (!impl_->capabilities.canInstallUpdates)
    {
        PLOG_INFO << "Update check skipped: updates are not supported on this build";
        return std::nullopt;
    }

    InFlightGuard guard(impl_->checksInFlight);
    clearLastError();

    UpdateInfo info;
    std::string error;
    if (impl_->checker->checkLatestRelease(impl_->currentVersion, info, error))
    {
        return info;
    }

    if (!error.empty())
    {
        recordError(UpdateError(UpdateErrorKind::Manifest, kCheckFailedMessage, error, 0));
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::UpdateCheck, kCheckFailedMessage, error);
    }
    return std::nullopt;
}

void UpdaterService::checkForUpdatesAsync(UpdateCheckCallback callback)
{
    bool started = impl_->launch(
        [this, callback]()
        {
            auto update = checkForUpdates();
            if (callback)
            {
                callback(update);
            }
        });

    if (!started)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        if (callback)
        {
            callback(std::nullopt);
        }
    }
}

bool UpdaterService::downloadAndInstall(const std::string& url, const DownloadProgressCallback& onProgress,
                                        UpdateError& outError)
{
    if (!impl_->initialized)
    {
        outError = UpdateError(UpdateErrorKind::UnsupportedPlatform, messages::kUnsupportedPlatform,
                               "UpdaterService not initialized", 0);
        PLOG_ERROR << outError.technicalInfo;
        return false;
    }

    clearLastError();

    std::string location;
    if (!impl_->downloader->download(url, onProgress, location, outError))
    {
        recordError(outError);
        if (outError.kind != UpdateErrorKind::UnsupportedPlatform)
        {
            PLOG_ERROR << "Download failed: " << outError.message
                       << (outError.technicalInfo.empty() ? "" : " (" + outError.technicalInfo + ")");
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Download, outError.message,
                                              outError.technicalInfo);
        }
        return false;
    }

    PLOG_INFO << "Package downloaded: " << location;

    if (!impl_->installer->install(location, outError))
    {
        recordError(outError);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Install, outError.message, outError.technicalInfo);
        return false;
    }

    return true;
}

void UpdaterService::downloadAndInstallAsync(const std::string& url, DownloadProgressCallback onProgress,
                                             InstallCompleteCallback onComplete)
{
    bool started = impl_->launch(
        [this, url, onProgress = std::move(onProgress), onComplete]()
        {
            UpdateError error;
            bool success = downloadAndInstall(url, onProgress, error);
            if (onComplete)
            {
                onComplete(success, error);
            }
        });

    if (!started)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        if (onComplete)
        {
            onComplete(false, UpdateError(UpdateErrorKind::UnsupportedPlatform, messages::kUnsupportedPlatform,
                                          "UpdaterService not initialized", 0));
        }
    }
}

VersionDescriptor UpdaterService::getCurrentVersion() const { return impl_->currentVersion; }

bool UpdaterService::scheduleUpdateChecks(int intervalMinutes)
{
    if (!impl_->initialized)
    {
        PLOG_ERROR << "UpdaterService not initialized";
        return false;
    }

    if (intervalMinutes <= 0)
    {
        PLOG_WARNING << "Invalid update check interval " << intervalMinutes << " min, using "
                     << kDefaultIntervalMinutes;
        intervalMinutes = kDefaultIntervalMinutes;
    }

    return impl_->scheduler.start(std::chrono::minutes(intervalMinutes),
                                  [this]()
                                  {
                                      if (impl_->checksInFlight > 0)
                                      {
                                          PLOG_DEBUG << "Scheduled update check skipped, previous check still running";
                                          return;
                                      }

                                      auto update = checkForUpdates();
                                      if (!update)
                                      {
                                          return;
                                      }

                                      UpdateAvailableCallback callback;
                                      {
                                          std::lock_guard<std::mutex> lock(impl_->mutex);
                                          callback = impl_->updateAvailableCallback;
                                      }
                                      if (callback)
                                      {
                                          callback(*update);
                                      }
                                  });
}

void UpdaterService::setUpdateAvailableCallback(UpdateAvailableCallback callback)
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->updateAvailableCallback = std::move(callback);
}

bool UpdaterService::isScheduled() const { return impl_->scheduler.isArmed(); }

bool UpdaterService::isBroadcastVisible(std::optional<std::int64_t> broadcastCode) const
{
    return updater::isBroadcastVisible(broadcastCode, impl_->currentVersion);
}

UpdateError UpdaterService::getLastError() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->lastError;
}

bool UpdaterService::isInitialized() const { return impl_ && impl_->initialized; }

bool UpdaterService::canInstallUpdates() const { return impl_->capabilities.canInstallUpdates; }

std::size_t UpdaterService::pendingWorkerCount() const
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->reapFinishedWorkers();
    return impl_->workers.size();
}

void UpdaterService::clearLastError()
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->lastError = UpdateError();
}

void UpdaterService::recordError(const UpdateError& error)
{
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->lastError = error;
}

} // namespace updater

namespace
{
updater::UpdaterService* g_updaterService = nullptr;
}

updater::UpdaterService* UpdaterService_Get() { return g_updaterService; }

void UpdaterService_Set(updater::UpdaterService* service) { g_updaterService = service; }
