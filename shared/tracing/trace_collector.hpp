#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.h"
#include "trace_types.hpp"

namespace portwire::tracing {

using TraceListener = std::function<void(const TraceEntry&)>;

class TraceSubscription {
public:
    virtual ~TraceSubscription() = default;
    virtual Result<void> unsubscribe() = 0;
};

// Sink for trace entries.
class TraceCollector {
public:
    virtual ~TraceCollector() = default;

    virtual void collect(const TraceEntry& entry) = 0;
    virtual std::vector<TraceEntry> getTraces(const std::optional<TraceFilter>& filter = std::nullopt) = 0;
    virtual TraceStats getStats() = 0;
    virtual void clear() = 0;

    // listener runs synchronously after each collected entry
    virtual std::unique_ptr<TraceSubscription> subscribe(TraceListener listener) = 0;

    virtual Result<void> pin(const std::string& trace_id) = 0;
    virtual Result<void> unpin(const std::string& trace_id) = 0;
};

} // namespace portwire::tracing
