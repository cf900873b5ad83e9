#pragma once
#include <string>
#include <yaml-cpp/yaml.h>

#include "result.h"
#include "resolution_hooks.hpp"
#include "trace_types.hpp"
#include "tracing_container.hpp"

namespace portwire {

// ---------------------------
// container: section
// ---------------------------
struct ContainerSection {
    ScopedFromRootPolicy scoped_from_root = ScopedFromRootPolicy::Reject;
};

// ---------------------------
// tracing: section
// ---------------------------
struct TracingSection {
    bool enabled = false;
    tracing::RetentionPolicy retention;
};

// Runtime settings read from portwire.yaml.
struct ContainerConfig {
    ContainerSection container;
    TracingSection tracing;
    YAML::Node log;             // handed to logging::configure as is; null when absent

    static constexpr const char* LOG_TAG = "portwire.config";

    static Result<ContainerConfig> load(const std::string& path);
    static Result<ContainerConfig> parse(const std::string& text);

    ContainerOptions containerOptions() const;
    tracing::TracingOptions tracingOptions() const;

    // configures logging from the log: section when present
    Result<void> applyLogging() const;
};

} // namespace portwire
