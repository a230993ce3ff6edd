#include "ProgressEvents.hpp"

#include <plog/Log.h>

#include <utility>
#include <vector>

namespace updater
{

ListenerId ProgressEventHub::addListener(ProgressListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const ListenerId id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ProgressEventHub::removeListener(ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

void ProgressEventHub::emit(const TransferProgress& progress)
{
    std::vector<ProgressListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_)
        {
            snapshot.push_back(listener);
        }
    }

    for (const auto& listener : snapshot)
    {
        if (listener)
        {
            listener(progress);
        }
    }
}

std::size_t ProgressEventHub::listenerCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

ProgressSubscription::ProgressSubscription(IProgressEvents& events, ProgressListener listener)
    : events_(&events)
    , id_(events.addListener(std::move(listener)))
{
}

ProgressSubscription::~ProgressSubscription() { reset(); }

ProgressSubscription::ProgressSubscription(ProgressSubscription&& other) noexcept
    : events_(std::exchange(other.events_, nullptr))
    , id_(std::exchange(other.id_, 0))
{
}

ProgressSubscription& ProgressSubscription::operator=(ProgressSubscription&& other) noexcept
{
    if (this != &other)
    {
        reset();
        events_ = std::exchange(other.events_, nullptr);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void ProgressSubscription::reset()
{
    IProgressEvents* events = std::exchange(events_, nullptr);
    if (events)
    {
        events->removeListener(id_);
        PLOG_DEBUG << "Progress listener " << id_ << " removed";
    }
}

} // namespace updater
