#include "tracing_container.hpp"

namespace portwire::tracing {

std::shared_ptr<TracingContainer> TracingContainer::create(GraphPtr graph, TracingOptions options)
{
    auto collector = options.collector
        ? options.collector
        : std::make_shared<MemoryCollector>(options.retention);
    auto tracer = std::make_shared<Tracer>(std::move(collector));

    ContainerOptions container_options;
    container_options.scoped_from_root = options.scoped_from_root;
    container_options.hooks = tracer;

    auto container = Container::create(std::move(graph), std::move(container_options));
    return std::shared_ptr<TracingContainer>(new TracingContainer(std::move(tracer), std::move(container)));
}

TracingContainer::TracingContainer(std::shared_ptr<Tracer> tracer, ContainerPtr container)
    : tracer_(std::move(tracer)),
      container_(std::move(container))
{
}

std::vector<TraceEntry> TracingContainer::getTraces(const std::optional<TraceFilter>& filter) const
{
    return tracer_->collector()->getTraces(filter);
}

TraceStats TracingContainer::getStats() const
{
    return tracer_->collector()->getStats();
}

std::unique_ptr<TraceSubscription> TracingContainer::subscribe(TraceListener listener)
{
    return tracer_->collector()->subscribe(std::move(listener));
}

Result<void> TracingContainer::pin(const std::string& trace_id)
{
    return tracer_->collector()->pin(trace_id);
}

Result<void> TracingContainer::unpin(const std::string& trace_id)
{
    return tracer_->collector()->unpin(trace_id);
}

} // namespace portwire::tracing
