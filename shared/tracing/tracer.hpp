#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "resolution_hooks.hpp"
#include "trace_collector.hpp"

namespace portwire::tracing {

// Resolution hooks that turn every resolve into a TraceEntry.
// Nested resolves become children of the resolve that triggered them.
class Tracer : public ResolutionHooks {
public:
    explicit Tracer(std::shared_ptr<TraceCollector> collector);

    void beforeResolve(const ResolutionHookContext& context) override;
    void afterResolve(const ResolutionResultContext& context) override;

    void pause() { paused_.store(true); }
    void resume() { paused_.store(false); }
    bool isPaused() const { return paused_.load(); }

    // empties the collector and restarts trace ids and order at 1
    void clear();

    const std::shared_ptr<TraceCollector>& collector() const { return collector_; }

private:
    struct ActiveTrace {
        std::string id;
        std::optional<std::string> parent_id;
        Clock::time_point start_time;
        std::vector<std::string> child_ids;
        bool recording;
    };

    std::shared_ptr<TraceCollector> collector_;
    std::atomic<bool> paused_{false};

    std::mutex mutex_;
    uint64_t trace_id_counter_ = 0;
    uint64_t order_counter_ = 0;
    std::vector<ActiveTrace> stack_;
};

} // namespace portwire::tracing
