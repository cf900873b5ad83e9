#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "trace_collector.hpp"
#include "listener_registry.hpp"

namespace portwire::tracing {

// Bounded in-memory buffer.
//  - entries at or above slow_threshold_ms are pinned on arrival
//  - past max_pinned_traces the oldest pinned entries are dropped
//  - past max_traces the oldest unpinned entries are dropped
//  - unpinned entries older than expiry_ms disappear on the next read
class MemoryCollector : public TraceCollector {
public:
    explicit MemoryCollector(RetentionPolicy policy = RetentionPolicy{});
    ~MemoryCollector() override = default;

    void collect(const TraceEntry& entry) override;
    std::vector<TraceEntry> getTraces(const std::optional<TraceFilter>& filter = std::nullopt) override;
    TraceStats getStats() override;
    void clear() override;
    std::unique_ptr<TraceSubscription> subscribe(TraceListener listener) override;

    Result<void> pin(const std::string& trace_id) override;
    Result<void> unpin(const std::string& trace_id) override;

    const RetentionPolicy& retentionPolicy() const { return policy_; }
    size_t size() const;

    static constexpr const char* LOG_TAG = "portwire.tracing";

private:
    using SteadyClock = std::chrono::steady_clock;

    struct StoredTrace {
        TraceEntry entry;
        SteadyClock::time_point collected_at;
    };

    // callers hold mutex_
    void enforcePinnedLimit_();
    void enforceTraceLimit_();
    void applyExpiry_();

    const RetentionPolicy policy_;
    const Clock::time_point session_start_;

    mutable std::mutex mutex_;
    std::vector<StoredTrace> traces_;
    std::shared_ptr<ListenerRegistry> listeners_;
};

} // namespace portwire::tracing
