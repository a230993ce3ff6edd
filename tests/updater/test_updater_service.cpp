#include <catch2/catch_test_macros.hpp>
#include "updater/UpdaterService.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/mock_http.hpp"
#include "../utils/test_doubles.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace updater;
using namespace test_utils;
using namespace std::chrono_literals;

namespace
{

const std::string kManifestUrl = "https://updates.example.com/app/version.json";
const std::string kArtifactUrl = "https://example/app.bin";

struct ServiceFixture
{
    TempDir cache;
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::shared_ptr<RecordingInstallerBridge> installer = std::make_shared<RecordingInstallerBridge>();
    UpdaterConfig config;
    platform::PlatformCapabilities caps;
    UpdaterService service;

    ServiceFixture()
    {
        config.manifestUrl = kManifestUrl;
        caps.canInstallUpdates = true;
        caps.streamingDownload = true;
        caps.installerAvailable = true;
        caps.platformName = "test";
    }

    bool start(bool withInstaller = true)
    {
        UpdaterDependencies deps;
        deps.http = http;
        deps.installer = withInstaller ? installer : nullptr;
        deps.cacheRoot = cache.path();
        return service.initialize(config, VersionDescriptor("1.0.0", 9), caps, std::move(deps));
    }
};

// Polls until pred holds or the deadline passes
template<typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds deadline = 5000ms)
{
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// Lets held manifest requests go even when an assertion fails first
struct ReleaseHeldRequests
{
    MockHttpClient& http;
    ~ReleaseHeldRequests() { http.releaseRequests(); }
};

} // namespace

TEST_CASE("UpdaterService - End to end update", "[updater][service]")
{
    SECTION("Newer release is downloaded and handed to the installer")
    {
        for (bool streaming : { true, false })
        {
            INFO("streaming " << streaming);
            ServiceFixture run;
            run.caps.streamingDownload = streaming;
            run.http->setResponse(kManifestUrl, MockResponses::manifest(10, kArtifactUrl, false));
            run.http->setResponse(kArtifactUrl, MockResponses::artifact(32 * 1024, 4096));
            REQUIRE(run.start());

            auto update = run.service.checkForUpdates();
            REQUIRE(update.has_value());
            REQUIRE(update->versionCode == 10);
            REQUIRE(update->downloadUrl == kArtifactUrl);
            REQUIRE_FALSE(update->mandatory);

            std::vector<float> progress;
            UpdateError error;
            REQUIRE(run.service.downloadAndInstall(update->downloadUrl, [&](float p) { progress.push_back(p); },
                                                   error));
            REQUIRE(error.empty());

            auto locations = run.installer->locations();
            REQUIRE(locations.size() == 1);
            REQUIRE(run.installer->existedAtCall()[0]);
            REQUIRE(std::filesystem::path(locations[0]).parent_path() ==
                    std::filesystem::absolute(run.cache.path()));
            REQUIRE_FALSE(progress.empty());
            REQUIRE(progress.back() == 100.0f);
        }
    }

    SECTION("Same release is not an update and nothing is installed")
    {
        ServiceFixture fx;
        fx.http->setResponse(kManifestUrl, MockResponses::manifest(9, kArtifactUrl));
        REQUIRE(fx.start());

        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(fx.installer->callCount() == 0);
        REQUIRE(fx.service.getLastError().empty());
    }

    SECTION("Without an installer the download still succeeds")
    {
        ServiceFixture fx;
        fx.http->setResponse(kArtifactUrl, MockResponses::artifact(1024));
        REQUIRE(fx.start(false));

        UpdateError error;
        REQUIRE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, error));
        REQUIRE(fx.installer->callCount() == 0);
    }
}

TEST_CASE("UpdaterService - Capability gate", "[updater][service]")
{
    ServiceFixture fx;
    fx.caps.canInstallUpdates = false;
    fx.http->setResponse(kManifestUrl, MockResponses::manifest(10, kArtifactUrl));
    fx.http->setResponse(kArtifactUrl, MockResponses::artifact(1024));
    REQUIRE(fx.start());
    REQUIRE(fx.service.isInitialized());
    REQUIRE_FALSE(fx.service.canInstallUpdates());

    SECTION("Check makes no network call")
    {
        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(fx.http->callCount() == 0);
    }

    SECTION("Download is refused before any I/O")
    {
        UpdateError error;
        REQUIRE_FALSE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, error));
        REQUIRE(error.kind == UpdateErrorKind::UnsupportedPlatform);
        REQUIRE(fx.http->callCount() == 0);
        REQUIRE(fx.installer->callCount() == 0);
        REQUIRE(fx.cache.fileCount() == 0);
    }
}

TEST_CASE("UpdaterService - Manifest failures surface as no update", "[updater][service]")
{
    auto& logs = LogCapture::instance();
    logs.clear();
    utils::ErrorReporter::ClearErrors();

    ServiceFixture fx;
    REQUIRE(fx.start());

    SECTION("HTTP 500")
    {
        fx.http->setResponse(kManifestUrl, MockResponses::server_error_500());

        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(logs.contains("Update check returned status 500", plog::error));
        REQUIRE(fx.service.getLastError().kind == UpdateErrorKind::Manifest);

        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].category == utils::ErrorCategory::UpdateCheck);
    }

    SECTION("Network failure")
    {
        fx.http->simulateNetworkError("Couldn't connect to server");
        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(fx.service.getLastError().technicalInfo.find("Couldn't connect") != std::string::npos);
    }

    SECTION("Malformed manifest")
    {
        MockResponse broken;
        broken.body = R"({"versionCode": "soon"})";
        fx.http->setResponse(kManifestUrl, broken);
        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(fx.installer->callCount() == 0);
    }

    SECTION("A later successful check clears the error")
    {
        fx.http->setResponse(kManifestUrl, MockResponses::server_error_500());
        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE_FALSE(fx.service.getLastError().empty());

        fx.http->setResponse(kManifestUrl, MockResponses::manifest(9, kArtifactUrl));
        REQUIRE_FALSE(fx.service.checkForUpdates().has_value());
        REQUIRE(fx.service.getLastError().empty());
    }
}

TEST_CASE("UpdaterService - Download and install failures", "[updater][service]")
{
    utils::ErrorReporter::ClearErrors();
    ServiceFixture fx;
    REQUIRE(fx.start());

    SECTION("Transfer error is returned and nothing is installed")
    {
        fx.http->setResponse(kArtifactUrl, MockResponses::timeout_error());

        UpdateError error;
        REQUIRE_FALSE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, error));
        REQUIRE(error.kind == UpdateErrorKind::Timeout);
        REQUIRE(error.message == messages::kTimeout);
        REQUIRE(fx.installer->callCount() == 0);
        REQUIRE(fx.service.getLastError().kind == UpdateErrorKind::Timeout);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Download);
    }

    SECTION("Installer error propagates unchanged")
    {
        fx.http->setResponse(kArtifactUrl, MockResponses::artifact(512));
        UpdateError original(UpdateErrorKind::Installer, "User cancelled installation", "RESULT_CANCELED", 2);
        fx.installer->failWith(original);

        UpdateError error;
        REQUIRE_FALSE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, error));
        REQUIRE(error.message == original.message);
        REQUIRE(error.technicalInfo == original.technicalInfo);
        REQUIRE(error.errorCode == original.errorCode);
        REQUIRE(fx.installer->callCount() == 1);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Install);
    }

    SECTION("A later successful download clears the error")
    {
        fx.http->setResponse(kArtifactUrl, MockResponses::network_error());
        UpdateError error;
        REQUIRE_FALSE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, error));
        REQUIRE(fx.service.getLastError().kind == UpdateErrorKind::Network);

        fx.http->setResponse(kArtifactUrl, MockResponses::artifact(256));
        UpdateError second;
        REQUIRE(fx.service.downloadAndInstall(kArtifactUrl, nullptr, second));
        REQUIRE(fx.service.getLastError().empty());
    }
}

TEST_CASE("UpdaterService - Concurrent downloads stage separate files", "[updater][service]")
{
    for (bool streaming : { true, false })
    {
        INFO("streaming " << streaming);
        ServiceFixture fx;
        fx.caps.streamingDownload = streaming;
        fx.http->setResponse(kArtifactUrl, MockResponses::artifact(16 * 1024, 1024));
        REQUIRE(fx.start());

        std::atomic<int> succeeded{ 0 };
        auto worker = [&]
        {
            UpdateError error;
            if (fx.service.downloadAndInstall(kArtifactUrl, [](float) {}, error))
                ++succeeded;
        };
        std::thread a(worker);
        std::thread b(worker);
        a.join();
        b.join();

        REQUIRE(succeeded == 2);
        auto locations = fx.installer->locations();
        REQUIRE(locations.size() == 2);
        REQUIRE(locations[0] != locations[1]);
    }
}

TEST_CASE("UpdaterService - Async operations", "[updater][service]")
{
    // Declared before the service so they outlive its worker threads
    std::mutex mutex;
    std::condition_variable done;

    ServiceFixture fx;
    fx.http->setResponse(kManifestUrl, MockResponses::manifest(11, kArtifactUrl, true));
    fx.http->setResponse(kArtifactUrl, MockResponses::artifact(2048));
    REQUIRE(fx.start());

    SECTION("Check reports its result on a worker thread")
    {
        std::optional<UpdateInfo> result;
        bool finished = false;
        fx.service.checkForUpdatesAsync(
            [&](const std::optional<UpdateInfo>& update)
            {
                std::lock_guard<std::mutex> lock(mutex);
                result = update;
                finished = true;
                done.notify_one();
            });

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(done.wait_for(lock, 5s, [&] { return finished; }));
        REQUIRE(result.has_value());
        REQUIRE(result->mandatory);
    }

    SECTION("Download and install completes on a worker thread")
    {
        bool finished = false;
        bool success = false;
        fx.service.downloadAndInstallAsync(kArtifactUrl, nullptr,
                                           [&](bool ok, const UpdateError&)
                                           {
                                               std::lock_guard<std::mutex> lock(mutex);
                                               success = ok;
                                               finished = true;
                                               done.notify_one();
                                           });

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(done.wait_for(lock, 5s, [&] { return finished; }));
        REQUIRE(success);
        REQUIRE(fx.installer->callCount() == 1);
    }

    SECTION("Finished workers are reclaimed")
    {
        std::atomic<int> completed{ 0 };
        for (int i = 0; i < 50; ++i)
        {
            fx.service.checkForUpdatesAsync([&](const std::optional<UpdateInfo>&) { ++completed; });
            REQUIRE(waitFor([&] { return completed == i + 1; }));
            REQUIRE(fx.service.pendingWorkerCount() <= 2);
        }
        REQUIRE(waitFor([&] { return fx.service.pendingWorkerCount() == 0; }));
    }

    SECTION("Work is refused after shutdown")
    {
        fx.service.shutdown();
        REQUIRE_FALSE(fx.service.isInitialized());

        bool called = false;
        fx.service.checkForUpdatesAsync([&](const std::optional<UpdateInfo>& update)
                                        { called = !update.has_value(); });
        REQUIRE(called);
    }
}

TEST_CASE("UpdaterService - Scheduled checks", "[updater][service]")
{
    std::mutex mutex;
    std::condition_variable done;
    std::optional<UpdateInfo> announced;
    auto& logs = LogCapture::instance();
    logs.clear();

    ServiceFixture fx;
    fx.http->setResponse(kManifestUrl, MockResponses::manifest(12, kArtifactUrl, true));
    REQUIRE(fx.start());

    fx.service.setUpdateAvailableCallback(
        [&](const UpdateInfo& info)
        {
            std::lock_guard<std::mutex> lock(mutex);
            announced = info;
            done.notify_one();
        });

    SECTION("First check runs immediately and announces the update")
    {
        REQUIRE(fx.service.scheduleUpdateChecks(60));
        REQUIRE(fx.service.isScheduled());

        std::unique_lock<std::mutex> lock(mutex);
        REQUIRE(done.wait_for(lock, 5s, [&] { return announced.has_value(); }));
        REQUIRE(announced->versionCode == 12);
        REQUIRE(announced->mandatory);
    }

    SECTION("Second schedule is rejected")
    {
        REQUIRE(fx.service.scheduleUpdateChecks(60));
        REQUIRE_FALSE(fx.service.scheduleUpdateChecks(60));
    }

    SECTION("Non-positive interval falls back to the default")
    {
        REQUIRE(fx.service.scheduleUpdateChecks(0));
        REQUIRE(fx.service.isScheduled());
        REQUIRE(logs.contains("Invalid update check interval 0 min, using 60", plog::warning));
        REQUIRE(logs.contains("Scheduling update checks every 3600 s", plog::info));
    }

    SECTION("A tick is skipped while a check is in flight")
    {
        ReleaseHeldRequests release{ *fx.http };
        fx.http->holdRequests();
        fx.service.checkForUpdatesAsync(UpdateCheckCallback{});
        REQUIRE(waitFor([&] { return fx.http->heldRequests() == 1; }));

        REQUIRE(fx.service.scheduleUpdateChecks(60));
        REQUIRE(waitFor([&] { return logs.contains("Scheduled update check skipped"); }));
        REQUIRE(fx.http->callCount(kManifestUrl) == 1);

        fx.http->releaseRequests();
        REQUIRE(waitFor([&] { return fx.service.pendingWorkerCount() == 0; }));
        REQUIRE(fx.http->callCount(kManifestUrl) == 1);

        std::lock_guard<std::mutex> lock(mutex);
        REQUIRE_FALSE(announced.has_value());
    }

    SECTION("Shutdown disarms the schedule")
    {
        REQUIRE(fx.service.scheduleUpdateChecks(60));
        fx.service.shutdown();
        REQUIRE_FALSE(fx.service.isScheduled());
    }
}

TEST_CASE("UpdaterService - Version queries", "[updater][service]")
{
    ServiceFixture fx;

    SECTION("Invalid configuration fails initialization")
    {
        fx.config.manifestUrl.clear();
        REQUIRE_FALSE(fx.start());
        REQUIRE_FALSE(fx.service.isInitialized());
    }

    SECTION("Reports the running version and gates broadcasts")
    {
        REQUIRE(fx.start());
        auto version = fx.service.getCurrentVersion();
        REQUIRE(version.name == "1.0.0");
        REQUIRE(version.code == 9);

        REQUIRE(fx.service.isBroadcastVisible(std::nullopt));
        REQUIRE(fx.service.isBroadcastVisible(9));
        REQUIRE_FALSE(fx.service.isBroadcastVisible(10));
    }
}
