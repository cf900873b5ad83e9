#pragma once
#include <future>
#include <memory>
#include <optional>
#include <vector>

#include "container.hpp"
#include "memory_collector.hpp"
#include "tracer.hpp"

namespace portwire::tracing {

struct TracingOptions {
    // MemoryCollector with `retention` when unset
    std::shared_ptr<TraceCollector> collector;
    RetentionPolicy retention;
    ScopedFromRootPolicy scoped_from_root = ScopedFromRootPolicy::Reject;
};

// Container whose resolutions are recorded as trace entries.
//
//   auto traced = TracingContainer::create(graph);
//   traced->resolve(UserServicePort);
//   auto stats = traced->getStats();
class TracingContainer {
public:
    static std::shared_ptr<TracingContainer> create(GraphPtr graph, TracingOptions options = TracingOptions{});

    template<typename T>
    [[nodiscard]] std::shared_ptr<T> resolve(const Port<T>& port) {
        return container_->resolve(port);
    }

    std::shared_ptr<Scope> createScope() { return container_->createScope(); }
    std::shared_future<void> dispose() { return container_->dispose(); }
    bool isDisposed() const { return container_->isDisposed(); }

    const ContainerPtr& container() const { return container_; }

    std::vector<TraceEntry> getTraces(const std::optional<TraceFilter>& filter = std::nullopt) const;
    TraceStats getStats() const;
    std::unique_ptr<TraceSubscription> subscribe(TraceListener listener);

    void pause() { tracer_->pause(); }
    void resume() { tracer_->resume(); }
    bool isPaused() const { return tracer_->isPaused(); }
    void clear() { tracer_->clear(); }

    // NotFound when no retained trace has `trace_id`
    Result<void> pin(const std::string& trace_id);
    Result<void> unpin(const std::string& trace_id);

private:
    TracingContainer(std::shared_ptr<Tracer> tracer, ContainerPtr container);

    std::shared_ptr<Tracer> tracer_;
    ContainerPtr container_;
};

} // namespace portwire::tracing
