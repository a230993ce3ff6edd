#include "UpdateScheduler.hpp"

#include <plog/Log.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace updater
{

namespace
{

// Stop state of one arming. The loop thread owns a reference, so a loop
// detached by stop() never observes a later start().
struct Run
{
    std::mutex mutex;
    std::condition_variable wake;
    bool stopRequested = false;
};

void runLoop(const std::shared_ptr<Run>& run, const std::shared_ptr<std::atomic<std::uint64_t>>& ticks,
             std::chrono::milliseconds interval, const UpdateScheduler::CheckTask& task)
{
    for (;;)
    {
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "Scheduled update check threw: " << e.what();
        }
        ++*ticks;

        std::unique_lock<std::mutex> lock(run->mutex);
        if (run->wake.wait_for(lock, interval, [&run] { return run->stopRequested; }))
        {
            break;
        }
    }
}

} // namespace

struct UpdateScheduler::Impl
{
    std::shared_ptr<Run> current;
    std::thread worker;
    std::atomic<bool> armed{ false };
    std::shared_ptr<std::atomic<std::uint64_t>> ticks = std::make_shared<std::atomic<std::uint64_t>>(0);
};

UpdateScheduler::UpdateScheduler()
    : impl_(std::make_unique<Impl>())
{
}

UpdateScheduler::~UpdateScheduler() { stop(); }

bool UpdateScheduler::start(std::chrono::milliseconds interval, CheckTask task)
{
    if (interval.count() <= 0 || !task)
    {
        PLOG_ERROR << "Refusing to schedule update checks with interval " << interval.count() << " ms";
        return false;
    }

    if (impl_->armed.exchange(true))
    {
        PLOG_WARNING << "Update checks already scheduled";
        return false;
    }

    auto run = std::make_shared<Run>();
    impl_->current = run;

    PLOG_INFO << "Scheduling update checks every " << interval.count() / 1000 << " s";
    impl_->worker = std::thread([run, ticks = impl_->ticks, interval, task = std::move(task)]()
                                { runLoop(run, ticks, interval, task); });
    return true;
}

void UpdateScheduler::stop()
{
    if (!impl_->armed)
    {
        return;
    }

    if (auto run = std::move(impl_->current))
    {
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->stopRequested = true;
        }
        run->wake.notify_all();
    }

    if (impl_->worker.joinable())
    {
        if (impl_->worker.get_id() == std::this_thread::get_id())
        {
            // Stopped from inside a check; the loop exits after this tick
            impl_->worker.detach();
        }
        else
        {
            impl_->worker.join();
        }
    }

    impl_->armed = false;
    PLOG_INFO << "Update checks disarmed";
}

bool UpdateScheduler::isArmed() const { return impl_->armed; }

std::uint64_t UpdateScheduler::tickCount() const { return *impl_->ticks; }

} // namespace updater
