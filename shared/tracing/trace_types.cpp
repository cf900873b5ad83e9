#include "trace_types.hpp"

#include "helper.hpp"

namespace portwire::tracing {

bool TraceFilter::matches(const TraceEntry& entry) const
{
    if (port_name && toLower(entry.port_name).find(toLower(*port_name)) == std::string::npos)
        return false;
    if (lifetime && entry.lifetime != *lifetime)
        return false;
    if (is_cache_hit && entry.is_cache_hit != *is_cache_hit)
        return false;
    if (min_duration_ms && entry.duration.count() < *min_duration_ms)
        return false;
    if (max_duration_ms && entry.duration.count() > *max_duration_ms)
        return false;
    if (scope_id && entry.scope_id != *scope_id)
        return false;
    if (is_pinned && entry.is_pinned != *is_pinned)
        return false;
    return true;
}

} // namespace portwire::tracing
