#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace updater
{

// Runs a check immediately, then once per interval, on its own thread.
// Armed from start() until stop() or destruction.
class UpdateScheduler
{
public:
    using CheckTask = std::function<void()>;

    UpdateScheduler();
    ~UpdateScheduler();

    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    // Returns false if already armed or the interval is not positive
    bool start(std::chrono::milliseconds interval, CheckTask task);

    // Waits for a running check to finish; no-op when disarmed
    void stop();

    bool isArmed() const;
    std::uint64_t tickCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
