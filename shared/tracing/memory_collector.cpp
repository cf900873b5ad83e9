#include "memory_collector.hpp"

#include <algorithm>

#include "logging.hpp"

namespace portwire::tracing {

MemoryCollector::MemoryCollector(RetentionPolicy policy)
    : policy_(policy),
      session_start_(Clock::now()),
      listeners_(ListenerRegistry::create())
{
}

void MemoryCollector::collect(const TraceEntry& entry)
{
    TraceEntry stored = entry;
    if (stored.duration.count() >= policy_.slow_threshold_ms) {
        stored.is_pinned = true;
        LOGW("slow resolution of '{}': {:.3f} ms ({})", stored.port_name, stored.duration.count(), stored.id);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        traces_.push_back(StoredTrace{ stored, SteadyClock::now() });
        enforcePinnedLimit_();
        enforceTraceLimit_();
    }
    listeners_->notify(stored);
}

std::vector<TraceEntry> MemoryCollector::getTraces(const std::optional<TraceFilter>& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyExpiry_();

    std::vector<TraceEntry> result;
    result.reserve(traces_.size());
    for (const auto& stored : traces_) {
        if (filter && !filter->matches(stored.entry)) continue;
        result.push_back(stored.entry);
    }
    return result;
}

TraceStats MemoryCollector::getStats()
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyExpiry_();

    TraceStats stats;
    stats.session_start = session_start_;
    stats.total_resolutions = traces_.size();
    if (traces_.empty()) return stats;

    size_t cache_hits = 0;
    for (const auto& stored : traces_) {
        const auto duration = stored.entry.duration.count();
        stats.total_duration_ms += duration;
        if (stored.entry.is_cache_hit) ++cache_hits;
        if (duration >= policy_.slow_threshold_ms) ++stats.slow_count;
    }
    const auto total = static_cast<double>(stats.total_resolutions);
    stats.average_duration_ms = stats.total_duration_ms / total;
    stats.cache_hit_rate = static_cast<double>(cache_hits) / total;
    return stats;
}

void MemoryCollector::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

std::unique_ptr<TraceSubscription> MemoryCollector::subscribe(TraceListener listener)
{
    return listeners_->add(std::move(listener));
}

Result<void> MemoryCollector::pin(const std::string& trace_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(traces_.begin(), traces_.end(),
        [&trace_id](const StoredTrace& stored) { return stored.entry.id == trace_id; });
    if (it == traces_.end())
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);

    if (!it->entry.is_pinned) {
        it->entry.is_pinned = true;
        enforcePinnedLimit_();
    }
    return OK();
}

Result<void> MemoryCollector::unpin(const std::string& trace_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(traces_.begin(), traces_.end(),
        [&trace_id](const StoredTrace& stored) { return stored.entry.id == trace_id; });
    if (it == traces_.end())
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);

    it->entry.is_pinned = false;
    return OK();
}

size_t MemoryCollector::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_.size();
}

void MemoryCollector::enforcePinnedLimit_()
{
    size_t pinned = std::count_if(traces_.begin(), traces_.end(),
        [](const StoredTrace& stored) { return stored.entry.is_pinned; });

    for (auto it = traces_.begin(); pinned > policy_.max_pinned_traces && it != traces_.end();) {
        if (it->entry.is_pinned) {
            it = traces_.erase(it);
            --pinned;
        } else {
            ++it;
        }
    }
}

void MemoryCollector::enforceTraceLimit_()
{
    while (traces_.size() > policy_.max_traces) {
        auto oldest = std::find_if(traces_.begin(), traces_.end(),
            [](const StoredTrace& stored) { return !stored.entry.is_pinned; });
        if (oldest == traces_.end()) break;
        traces_.erase(oldest);
    }
}

void MemoryCollector::applyExpiry_()
{
    const auto now = SteadyClock::now();
    const auto expiry = std::chrono::duration<double, std::milli>(policy_.expiry_ms);
    traces_.erase(std::remove_if(traces_.begin(), traces_.end(),
        [&](const StoredTrace& stored) {
            return !stored.entry.is_pinned && (now - stored.collected_at) > expiry;
        }),
        traces_.end());
}

} // namespace portwire::tracing
