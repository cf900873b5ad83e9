#include "graph.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

namespace portwire {

Graph::Graph(std::vector<AdapterPtr> adapters)
    : adapters_(std::move(adapters))
{
    index_.reserve(adapters_.size());
    for (size_t i = 0; i < adapters_.size(); ++i) {
        index_.emplace(adapters_[i]->portName(), i);
    }
}

AdapterPtr Graph::findAdapter(const std::string& port_name) const
{
    auto it = index_.find(port_name);
    if (it == index_.end()) return nullptr;
    return adapters_[it->second];
}

std::vector<std::string> Graph::portNames() const
{
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& adapter : adapters_) {
        names.push_back(adapter->portName());
    }
    std::sort(names.begin(), names.end());
    return names;
}

namespace {

std::string capitalized(Lifetime lifetime)
{
    std::string name = to_string(lifetime);
    if (!name.empty()) name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

} // namespace

std::string CaptiveDependency::message() const
{
    return fmt::format("{} '{}' cannot depend on {} '{}'",
        capitalized(lifetime), port_name, capitalized(dependency_lifetime), dependency_name);
}

std::vector<CaptiveDependency> findCaptiveDependencies(const Graph& graph)
{
    std::vector<CaptiveDependency> captives;
    for (const auto& adapter : graph.adapters()) {
        for (const auto& dependency : adapter->dependencies()) {
            auto provider = graph.findAdapter(dependency.name());
            if (!provider) continue;
            if (lifetimeRank(provider->lifetime()) > lifetimeRank(adapter->lifetime())) {
                captives.push_back(CaptiveDependency{
                    adapter->portName(), adapter->lifetime(),
                    provider->portName(), provider->lifetime() });
            }
        }
    }
    return captives;
}

} // namespace portwire
