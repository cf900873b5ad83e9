#include "graph_builder.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

#include "logging.hpp"

namespace portwire {

GraphBuilder GraphBuilder::provide(AdapterPtr adapter) const
{
    if (!adapter)
        throw std::invalid_argument("GraphBuilder::provide() requires an adapter");

    if (provides(adapter->portName()))
        throw DuplicateProviderError(adapter->portName());

    auto node = std::make_shared<Node>(Node{ std::move(adapter), head_, size() + 1 });
    return GraphBuilder(std::move(node));
}

GraphBuilder GraphBuilder::merge(const GraphBuilder& other) const
{
    GraphBuilder merged = *this;
    for (auto& adapter : other.adapters()) {
        merged = merged.provide(adapter);
    }
    return merged;
}

bool GraphBuilder::provides(const std::string& port_name) const
{
    for (auto node = head_.get(); node != nullptr; node = node->prev.get()) {
        if (node->adapter->portName() == port_name) return true;
    }
    return false;
}

std::vector<AdapterPtr> GraphBuilder::adapters() const
{
    std::vector<AdapterPtr> result(size());
    size_t index = result.size();
    for (auto node = head_.get(); node != nullptr; node = node->prev.get()) {
        result[--index] = node->adapter;
    }
    return result;
}

std::vector<std::string> GraphBuilder::providedPorts() const
{
    std::set<std::string> provided;
    for (auto node = head_.get(); node != nullptr; node = node->prev.get()) {
        provided.insert(node->adapter->portName());
    }
    return { provided.begin(), provided.end() };
}

std::vector<std::string> GraphBuilder::requiredPorts() const
{
    std::set<std::string> required;
    for (auto node = head_.get(); node != nullptr; node = node->prev.get()) {
        for (const auto& dependency : node->adapter->dependencies()) {
            required.insert(dependency.name());
        }
    }
    return { required.begin(), required.end() };
}

std::vector<std::string> GraphBuilder::missingPorts() const
{
    auto provided = providedPorts();
    auto required = requiredPorts();

    std::vector<std::string> missing;
    std::set_difference(required.begin(), required.end(),
                        provided.begin(), provided.end(),
                        std::back_inserter(missing));
    return missing;
}

GraphPtr GraphBuilder::build() const
{
    auto missing = missingPorts();
    if (!missing.empty()) {
        LOGD("graph rejected, {} missing port(s)", missing.size());
        throw MissingDependencyError(std::move(missing));
    }

    GraphPtr graph(new Graph(adapters()));
    LOGD("graph built with {} adapter(s)", graph->size());

    for (const auto& captive : findCaptiveDependencies(*graph)) {
        LOGW("captive dependency: {}", captive.message());
    }
    return graph;
}

} // namespace portwire
