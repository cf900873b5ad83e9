#include "composite_collector.hpp"

#include <algorithm>

#include "noop_collector.hpp"
#include "logging.hpp"

namespace portwire::tracing {

CompositeCollector::CompositeCollector(std::vector<std::shared_ptr<TraceCollector>> collectors)
    : collectors_(std::move(collectors))
{
    collectors_.erase(std::remove(collectors_.begin(), collectors_.end(), nullptr), collectors_.end());
}

void CompositeCollector::collect(const TraceEntry& entry)
{
    for (auto& collector : collectors_) {
        collector->collect(entry);
    }
}

std::vector<TraceEntry> CompositeCollector::getTraces(const std::optional<TraceFilter>& filter)
{
    if (collectors_.empty()) return {};
    return collectors_.front()->getTraces(filter);
}

TraceStats CompositeCollector::getStats()
{
    if (collectors_.empty()) return TraceStats{};
    return collectors_.front()->getStats();
}

void CompositeCollector::clear()
{
    for (auto& collector : collectors_) {
        collector->clear();
    }
}

std::unique_ptr<TraceSubscription> CompositeCollector::subscribe(TraceListener listener)
{
    if (collectors_.empty()) {
        static NoOpCollector empty;
        return empty.subscribe(std::move(listener));
    }
    return collectors_.front()->subscribe(std::move(listener));
}

Result<void> CompositeCollector::pin(const std::string& trace_id)
{
    if (collectors_.empty())
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);

    auto first = collectors_.front()->pin(trace_id);
    for (size_t i = 1; i < collectors_.size(); ++i) {
        auto res = collectors_[i]->pin(trace_id);
        if (!res) LOGD("pin on collector #{}: {}", i, to_string(res));
    }
    return first;
}

Result<void> CompositeCollector::unpin(const std::string& trace_id)
{
    if (collectors_.empty())
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);

    auto first = collectors_.front()->unpin(trace_id);
    for (size_t i = 1; i < collectors_.size(); ++i) {
        auto res = collectors_[i]->unpin(trace_id);
        if (!res) LOGD("unpin on collector #{}: {}", i, to_string(res));
    }
    return first;
}

} // namespace portwire::tracing
