#pragma once
#include "trace_collector.hpp"
#include "listener_registry.hpp"

namespace portwire::tracing {

// Discards everything. Subscriptions are accepted but never notified.
class NoOpCollector : public TraceCollector {
public:
    NoOpCollector() : listeners_(ListenerRegistry::create()), session_start_(Clock::now()) {}

    void collect(const TraceEntry&) override {}

    std::vector<TraceEntry> getTraces(const std::optional<TraceFilter>& = std::nullopt) override {
        return {};
    }

    TraceStats getStats() override {
        TraceStats stats;
        stats.session_start = session_start_;
        return stats;
    }

    void clear() override {}

    std::unique_ptr<TraceSubscription> subscribe(TraceListener listener) override {
        return listeners_->add(std::move(listener));
    }

    Result<void> pin(const std::string& trace_id) override {
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);
    }

    Result<void> unpin(const std::string& trace_id) override {
        return Error(ResultCode::NotFound, "no trace with id " + trace_id);
    }

private:
    std::shared_ptr<ListenerRegistry> listeners_;
    Clock::time_point session_start_;
};

} // namespace portwire::tracing
