#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "trace_collector.hpp"

namespace portwire::tracing {

// Thread-safe listener list. Subscriptions keep only a weak reference, so an
// unsubscribe after the registry is gone reports InvalidState instead of crashing.
class ListenerRegistry : public std::enable_shared_from_this<ListenerRegistry> {
public:
    static std::shared_ptr<ListenerRegistry> create() {
        return std::shared_ptr<ListenerRegistry>(new ListenerRegistry());
    }

    std::unique_ptr<TraceSubscription> add(TraceListener listener);

    // listeners run on the caller's thread, without the registry lock held
    void notify(const TraceEntry& entry) const;

    size_t size() const;

private:
    class Subscription : public TraceSubscription {
    public:
        Subscription(std::weak_ptr<ListenerRegistry> registry, uint64_t id)
            : registry_(std::move(registry)), id_(id) {}
        Result<void> unsubscribe() override;

    private:
        std::weak_ptr<ListenerRegistry> registry_;
        uint64_t id_;
    };

    ListenerRegistry() = default;
    bool remove_(uint64_t id);

    mutable std::mutex mutex_;
    uint64_t next_id_ = 0;
    std::map<uint64_t, TraceListener> listeners_;
};

} // namespace portwire::tracing
