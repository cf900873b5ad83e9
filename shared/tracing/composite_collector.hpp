#pragma once
#include <memory>
#include <vector>

#include "trace_collector.hpp"

namespace portwire::tracing {

// Fans collect/clear out to every collector; reads go to the first one.
class CompositeCollector : public TraceCollector {
public:
    explicit CompositeCollector(std::vector<std::shared_ptr<TraceCollector>> collectors);

    void collect(const TraceEntry& entry) override;
    std::vector<TraceEntry> getTraces(const std::optional<TraceFilter>& filter = std::nullopt) override;
    TraceStats getStats() override;
    void clear() override;
    std::unique_ptr<TraceSubscription> subscribe(TraceListener listener) override;

    // applied to every collector, the first one's result is returned
    Result<void> pin(const std::string& trace_id) override;
    Result<void> unpin(const std::string& trace_id) override;

    size_t size() const { return collectors_.size(); }

    static constexpr const char* LOG_TAG = "portwire.tracing";

private:
    std::vector<std::shared_ptr<TraceCollector>> collectors_;
};

} // namespace portwire::tracing
