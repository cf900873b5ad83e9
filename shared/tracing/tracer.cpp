#include "tracer.hpp"

#include <stdexcept>
#include <fmt/core.h>

namespace portwire::tracing {

Tracer::Tracer(std::shared_ptr<TraceCollector> collector)
    : collector_(std::move(collector))
{
    if (!collector_)
        throw std::invalid_argument("Tracer requires a collector");
}

void Tracer::beforeResolve(const ResolutionHookContext& /*context*/)
{
    std::lock_guard<std::mutex> lock(mutex_);

    ActiveTrace trace;
    trace.start_time = Clock::now();
    trace.recording = !paused_.load();
    if (trace.recording) {
        trace.id = fmt::format("trace-{}", ++trace_id_counter_);

        // nearest recording ancestor
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            if (!it->recording) continue;
            trace.parent_id = it->id;
            it->child_ids.push_back(trace.id);
            break;
        }
    }
    stack_.push_back(std::move(trace));
}

void Tracer::afterResolve(const ResolutionResultContext& context)
{
    TraceEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stack_.empty()) return;

        auto trace = std::move(stack_.back());
        stack_.pop_back();
        if (!trace.recording) return;

        entry.id = std::move(trace.id);
        entry.port_name = context.port_name;
        entry.lifetime = context.lifetime;
        entry.start_time = trace.start_time;
        entry.duration = context.duration;
        entry.is_cache_hit = context.is_cache_hit;
        entry.parent_trace_id = std::move(trace.parent_id);
        entry.child_trace_ids = std::move(trace.child_ids);
        entry.scope_id = context.scope_id;
        entry.order = ++order_counter_;
        entry.failed = static_cast<bool>(context.error);
    }
    collector_->collect(entry);
}

void Tracer::clear()
{
    collector_->clear();
    std::lock_guard<std::mutex> lock(mutex_);
    trace_id_counter_ = 0;
    order_counter_ = 0;
}

} // namespace portwire::tracing
