#pragma once

#include "UpdateTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace updater
{

using ProgressListener = std::function<void(const TransferProgress&)>;
using ListenerId = std::uint64_t;

// Registry of transfer progress listeners fed by the streaming transport
class IProgressEvents
{
public:
    virtual ~IProgressEvents() = default;

    virtual ListenerId addListener(ProgressListener listener) = 0;
    virtual void removeListener(ListenerId id) = 0;
    virtual void emit(const TransferProgress& progress) = 0;
};

class ProgressEventHub : public IProgressEvents
{
public:
    ListenerId addListener(ProgressListener listener) override;
    void removeListener(ListenerId id) override;

    // Listeners run on the emitting thread, outside the registry lock
    void emit(const TransferProgress& progress) override;

    std::size_t listenerCount() const;

private:
    mutable std::mutex mutex_;
    std::map<ListenerId, ProgressListener> listeners_;
    ListenerId nextId_ = 1;
};

// Owns one listener registration and removes it exactly once, on reset()
// or destruction, whichever comes first.
class ProgressSubscription
{
public:
    ProgressSubscription() = default;
    ProgressSubscription(IProgressEvents& events, ProgressListener listener);
    ~ProgressSubscription();

    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    ProgressSubscription(ProgressSubscription&& other) noexcept;
    ProgressSubscription& operator=(ProgressSubscription&& other) noexcept;

    void reset();
    bool active() const { return events_ != nullptr; }

private:
    IProgressEvents* events_ = nullptr;
    ListenerId id_ = 0;
};

} // namespace updater
