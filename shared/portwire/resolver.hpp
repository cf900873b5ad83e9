#pragma once
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "graph.hpp"
#include "memo_map.hpp"
#include "resolution_context.hpp"
#include "resolution_hooks.hpp"

namespace portwire {

    class Scope;

    enum class ResolutionStatus
    {
        Resolved,
        Unresolved,
        ScopeRequired,
    };

    constexpr const char* to_string(ResolutionStatus status) {
        switch (status) {
            case ResolutionStatus::Resolved:      return "resolved";
            case ResolutionStatus::Unresolved:    return "unresolved";
            case ResolutionStatus::ScopeRequired: return "scope-required";
        }
        return "unknown";
    }

    // State shared by a container and every scope below it.
    struct ContainerState {
        explicit ContainerState(GraphPtr graph, ContainerOptions options)
            : graph(std::move(graph)), options(std::move(options)) {}

        GraphPtr graph;
        ContainerOptions options;

        // serializes resolve / createScope / dispose across the whole tree
        std::recursive_mutex mutex;

        MemoMap singletons;
        uint64_t next_resolution_order = 0;
        uint64_t next_scope_id = 0;

        // chain of the resolve in progress; reentrant resolves from a factory join it
        ResolutionContext* active_context = nullptr;
    };


    struct MemoEntrySnapshot {
        std::string port_name;
        Lifetime lifetime;
        Clock::time_point resolved_at;
        uint64_t resolution_order;
    };

    // Copy of a resolver's caches and child list, taken under the tree lock.
    struct ResolverState {
        std::string id;
        bool disposed = false;
        std::vector<MemoEntrySnapshot> scoped;
        std::vector<MemoEntrySnapshot> singletons;   // root only
        std::vector<ResolverState> children;
    };


    // Common part of Container and Scope.
    // Active until dispose(); afterwards every operation except dispose()
    // throws DisposedResolverError.
    class Resolver : public std::enable_shared_from_this<Resolver>
    {
    public:
        virtual ~Resolver();

        template<typename T>
        [[nodiscard]] std::shared_ptr<T> resolve(const Port<T>& port) {
            return std::static_pointer_cast<T>(resolveErased(port.key()));
        }

        // Resolves by key; an invalid TypeId in `key` skips the type check.
        [[nodiscard]] Instance resolveErased(const PortKey& key);

        [[nodiscard]] std::shared_ptr<Scope> createScope();

        // Marks this resolver disposed before returning. The future completes
        // once the child scopes and every finalizer have settled; failures
        // surface as FinalizerError. Repeated calls return the same future.
        std::shared_future<void> dispose();

        bool isDisposed() const;

        // "container" for the root, "scope-<n>" for scopes
        const std::string& id() const { return id_; }
        virtual bool isRoot() const = 0;

        // true when resolving `port_name` here would need an enclosing scope
        bool requiresScope(const std::string& port_name) const;
        ResolutionStatus isResolved(const std::string& port_name) const;

        const GraphPtr& graph() const { return state_->graph; }
        std::shared_ptr<Resolver> parent() const { return parent_.lock(); }
        size_t childCount() const;

        ResolverState internalState() const;

    protected:
        Resolver(std::shared_ptr<ContainerState> state, std::string id, std::weak_ptr<Resolver> parent);

        virtual const char* logTag() const = 0;

        // entries finalized by dispose(), caller holds the tree lock
        virtual std::vector<MemoEntry> releaseOwned_();

        const std::shared_ptr<ContainerState>& state() const { return state_; }
        void checkActive_(const std::string& operation) const;

        MemoMap scoped_;

    private:
        Instance resolveWith_(const AdapterPtr& adapter, ResolutionContext& context);
        MemoMap* memoFor_(const Adapter& adapter);
        AdapterPtr findAdapter_(const std::string& port_name) const;
        void removeChild_(const Resolver* child);

        // moving forbidden
        Resolver(Resolver&&) = delete;
        Resolver& operator=(Resolver&&) = delete;

        // copying forbidden
        Resolver(const Resolver&) = delete;
        Resolver& operator=(const Resolver&) = delete;

        std::shared_ptr<ContainerState> state_;
        std::string id_;
        std::weak_ptr<Resolver> parent_;
        std::vector<std::shared_ptr<Scope>> children_;

        bool disposed_ = false;
        std::shared_future<void> disposal_;
    }; // class Resolver

}; // namespace portwire
