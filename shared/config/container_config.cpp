#include "container_config.hpp"

#include <fmt/core.h>

#include "helper.hpp"
#include "logging.hpp"
#include "result_helper.hpp"

namespace portwire {

namespace {

// Reads `node[key]` as T, keeping `out` when the key is absent.
template <typename T>
Result<void> readValue(const YAML::Node& node, const char* section, const char* key, T& out)
{
    const auto value = node[key];
    if (!value) return OK();
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        return Error(ResultCode::InvalidArgument, fmt::format("{}.{}: {}", section, key, e.what()));
    }
    return OK();
}

Result<void> checkSection(const YAML::Node& node, const char* section)
{
    if (node && !node.IsNull() && !node.IsMap())
        return Error(ResultCode::InvalidArgument, fmt::format("{}: expected a map", section));
    return OK();
}

Result<ContainerConfig> fromNode(const YAML::Node& root)
{
    ContainerConfig config;
    if (!root || root.IsNull()) return Result<ContainerConfig>::OK(config);
    if (!root.IsMap())
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, "top level: expected a map");

    const auto container = root["container"];
    auto res = checkSection(container, "container");
    RETURN_IF_ERR_AS(ContainerConfig, res, "config");
    if (container) {
        std::string policy;
        res = readValue(container, "container", "scoped_from_root", policy);
        RETURN_IF_ERR_AS(ContainerConfig, res, "config");
        if (!policy.empty()) {
            policy = toLower(policy);
            if (policy == "reject") {
                config.container.scoped_from_root = ScopedFromRootPolicy::Reject;
            } else if (policy == "allow") {
                config.container.scoped_from_root = ScopedFromRootPolicy::Allow;
            } else {
                return Result<ContainerConfig>::Error(ResultCode::InvalidArgument,
                    fmt::format("container.scoped_from_root: unknown policy '{}'", policy));
            }
        }
    }

    const auto tracing = root["tracing"];
    res = checkSection(tracing, "tracing");
    RETURN_IF_ERR_AS(ContainerConfig, res, "config");
    if (tracing) {
        auto& retention = config.tracing.retention;
        for (auto step : {
                 readValue(tracing, "tracing", "enabled", config.tracing.enabled),
                 readValue(tracing, "tracing", "max_traces", retention.max_traces),
                 readValue(tracing, "tracing", "max_pinned_traces", retention.max_pinned_traces),
                 readValue(tracing, "tracing", "slow_threshold_ms", retention.slow_threshold_ms),
                 readValue(tracing, "tracing", "expiry_ms", retention.expiry_ms) }) {
            RETURN_IF_ERR_AS(ContainerConfig, step, "config");
        }
        if (retention.slow_threshold_ms < 0)
            return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, "tracing.slow_threshold_ms: must not be negative");
        if (retention.expiry_ms < 0)
            return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, "tracing.expiry_ms: must not be negative");
    }

    const auto log = root["log"];
    res = checkSection(log, "log");
    RETURN_IF_ERR_AS(ContainerConfig, res, "config");
    if (log) config.log = log;

    return Result<ContainerConfig>::OK(config);
}

} // namespace

Result<ContainerConfig> ContainerConfig::load(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(LOG_TAG, "failed to load {}: {}", path, e.what());
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, fmt::format("{}: {}", path, e.what()));
    }
    auto config = fromNode(root);
    if (!config) LOG_ERROR(LOG_TAG, "invalid config {}: {}", path, config.error().value_or(""));
    return config;
}

Result<ContainerConfig> ContainerConfig::parse(const std::string& text)
{
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<ContainerConfig>::Error(ResultCode::InvalidArgument, e.what());
    }
    return fromNode(root);
}

ContainerOptions ContainerConfig::containerOptions() const
{
    ContainerOptions options;
    options.scoped_from_root = container.scoped_from_root;
    return options;
}

tracing::TracingOptions ContainerConfig::tracingOptions() const
{
    tracing::TracingOptions options;
    options.retention = tracing.retention;
    options.scoped_from_root = container.scoped_from_root;
    return options;
}

Result<void> ContainerConfig::applyLogging() const
{
    if (!log || log.IsNull()) return OK();
    YAML::Node document;
    document["log"] = YAML::Clone(log);
    return logging::configure(document);
}

} // namespace portwire
