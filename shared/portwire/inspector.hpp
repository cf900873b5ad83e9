#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "container.hpp"

namespace portwire {

    enum class ScopeStatus
    {
        Active,
        Disposed,
    };

    constexpr const char* to_string(ScopeStatus status) {
        return status == ScopeStatus::Active ? "active" : "disposed";
    }

    struct ScopeTree {
        std::string id;
        ScopeStatus status = ScopeStatus::Active;
        size_t resolved_count = 0;
        size_t total_count = 0;
        std::vector<ScopeTree> children;
    };

    struct SingletonEntry {
        std::string port_name;
        Lifetime lifetime = Lifetime::Singleton;
        bool is_resolved = false;
        std::optional<Clock::time_point> resolved_at;
        std::optional<uint64_t> resolution_order;
    };

    struct ContainerSnapshot {
        bool is_disposed = false;
        std::vector<SingletonEntry> singletons;     // graph registration order
        ScopeTree scopes;
    };

    // Read-only view over a container and its scope tree.
    // Every call throws DisposedResolverError once the container is disposed.
    class Inspector
    {
    public:
        explicit Inspector(std::shared_ptr<const Container> container);

        ContainerSnapshot snapshot() const;
        ScopeTree getScopeTree() const;

        // Throws PortNotFoundError for a port the graph does not provide.
        ResolutionStatus isResolved(const std::string& port_name) const;

        // sorted
        std::vector<std::string> listPorts() const;

    private:
        ScopeTree buildScopeTree_(const ResolverState& state) const;

        std::shared_ptr<const Container> container_;
    }; // class Inspector

}; // namespace portwire
