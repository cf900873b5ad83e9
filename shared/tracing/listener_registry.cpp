#include "listener_registry.hpp"

namespace portwire::tracing {

std::unique_ptr<TraceSubscription> ListenerRegistry::add(TraceListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    if (listener) listeners_.emplace(id, std::move(listener));
    return std::make_unique<Subscription>(weak_from_this(), id);
}

void ListenerRegistry::notify(const TraceEntry& entry) const
{
    std::vector<TraceListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener(entry);
    }
}

size_t ListenerRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

bool ListenerRegistry::remove_(uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) != 0;
}

Result<void> ListenerRegistry::Subscription::unsubscribe()
{
    auto registry = registry_.lock();
    if (!registry)
        return Error(ResultCode::InvalidState, "collector no longer exists");
    if (!registry->remove_(id_))
        return Error(ResultCode::NotFound, "already unsubscribed");
    return OK();
}

} // namespace portwire::tracing
