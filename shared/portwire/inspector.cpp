#include "inspector.hpp"

#include <stdexcept>
#include <unordered_map>

namespace portwire {

namespace {

ScopeTree scopeNode(const ResolverState& state, size_t total_count)
{
    ScopeTree node;
    node.id = state.id;
    node.status = state.disposed ? ScopeStatus::Disposed : ScopeStatus::Active;
    node.resolved_count = state.scoped.size();
    node.total_count = total_count;
    for (const auto& child : state.children) {
        node.children.push_back(scopeNode(child, total_count));
    }
    return node;
}

} // namespace

Inspector::Inspector(std::shared_ptr<const Container> container)
    : container_(std::move(container))
{
    if (!container_)
        throw std::invalid_argument("Inspector requires a container");
}

ScopeTree Inspector::buildScopeTree_(const ResolverState& state) const
{
    const auto& graph = *container_->graph();

    size_t scoped_adapters = 0;
    for (const auto& adapter : graph.adapters()) {
        if (adapter->lifetime() == Lifetime::Scoped) ++scoped_adapters;
    }

    ScopeTree root;
    root.id = state.id;
    root.status = state.disposed ? ScopeStatus::Disposed : ScopeStatus::Active;
    root.resolved_count = state.singletons.size();
    root.total_count = graph.size();
    for (const auto& child : state.children) {
        root.children.push_back(scopeNode(child, scoped_adapters));
    }
    return root;
}

ContainerSnapshot Inspector::snapshot() const
{
    auto state = container_->internalState();

    std::unordered_map<std::string, const MemoEntrySnapshot*> resolved;
    for (const auto& entry : state.singletons) {
        resolved.emplace(entry.port_name, &entry);
    }

    ContainerSnapshot snapshot;
    snapshot.is_disposed = state.disposed;
    for (const auto& adapter : container_->graph()->adapters()) {
        if (adapter->lifetime() != Lifetime::Singleton) continue;

        SingletonEntry entry;
        entry.port_name = adapter->portName();
        entry.lifetime = adapter->lifetime();
        auto it = resolved.find(entry.port_name);
        if (it != resolved.end()) {
            entry.is_resolved = true;
            entry.resolved_at = it->second->resolved_at;
            entry.resolution_order = it->second->resolution_order;
        }
        snapshot.singletons.push_back(std::move(entry));
    }
    snapshot.scopes = buildScopeTree_(state);
    return snapshot;
}

ScopeTree Inspector::getScopeTree() const
{
    return buildScopeTree_(container_->internalState());
}

ResolutionStatus Inspector::isResolved(const std::string& port_name) const
{
    return container_->isResolved(port_name);
}

std::vector<std::string> Inspector::listPorts() const
{
    if (container_->isDisposed())
        throw DisposedResolverError(container_->id(), "list ports");
    return container_->graph()->portNames();
}

} // namespace portwire
