#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lifetime.hpp"
#include "resolution_hooks.hpp"

namespace portwire::tracing {

using Clock = std::chrono::system_clock;

// One observed resolve call.
struct TraceEntry {
    std::string id;                     // "trace-<n>"
    std::string port_name;
    Lifetime lifetime = Lifetime::Singleton;
    Clock::time_point start_time;
    Milliseconds duration{0};
    bool is_cache_hit = false;
    std::optional<std::string> parent_trace_id;
    std::vector<std::string> child_trace_ids;
    std::string scope_id;               // empty for the root container
    uint64_t order = 0;
    bool is_pinned = false;
    bool failed = false;
};

struct RetentionPolicy {
    size_t max_traces = 1000;
    size_t max_pinned_traces = 100;
    double slow_threshold_ms = 100;
    double expiry_ms = 300000;
};

struct TraceStats {
    size_t total_resolutions = 0;
    double average_duration_ms = 0;
    double cache_hit_rate = 0;
    size_t slow_count = 0;
    Clock::time_point session_start;
    double total_duration_ms = 0;
};

// Every set field must match. Duration bounds are inclusive.
struct TraceFilter {
    std::optional<std::string> port_name;       // case-insensitive substring
    std::optional<Lifetime> lifetime;
    std::optional<bool> is_cache_hit;
    std::optional<double> min_duration_ms;
    std::optional<double> max_duration_ms;
    std::optional<std::string> scope_id;        // "" selects the root container
    std::optional<bool> is_pinned;

    bool matches(const TraceEntry& entry) const;
};

} // namespace portwire::tracing
