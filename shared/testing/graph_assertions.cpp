#include "graph_assertions.hpp"

#include <set>
#include <fmt/format.h>

namespace portwire::testing {

namespace {

AdapterPtr requireAdapter(const Graph& graph, const PortKey& port)
{
    auto adapter = graph.findAdapter(port.name());
    if (!adapter) {
        throw GraphAssertionError(fmt::format("Port '{}' is not provided in graph", port.name()),
                                  { port.name() });
    }
    return adapter;
}

} // namespace

void assertGraphComplete(const Graph& graph)
{
    std::set<std::string> missing;
    for (const auto& adapter : graph.adapters()) {
        for (const auto& dependency : adapter->dependencies()) {
            if (!graph.contains(dependency.name())) missing.insert(dependency.name());
        }
    }
    if (missing.empty()) return;

    std::vector<std::string> names(missing.begin(), missing.end());
    throw GraphAssertionError(fmt::format("Graph incomplete. Missing ports: {}", fmt::join(names, ", ")),
                              names);
}

void assertPortProvided(const Graph& graph, const PortKey& port)
{
    requireAdapter(graph, port);
}

void assertLifetime(const Graph& graph, const PortKey& port, Lifetime expected)
{
    auto adapter = requireAdapter(graph, port);
    if (adapter->lifetime() != expected) {
        throw GraphAssertionError(fmt::format("Port '{}' has lifetime '{}', expected '{}'",
                                              port.name(), to_string(adapter->lifetime()), to_string(expected)),
                                  { port.name() });
    }
}

} // namespace portwire::testing
