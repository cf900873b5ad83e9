#include "resolver.hpp"

#include <algorithm>
#include <fmt/core.h>

#include "scope.hpp"
#include "logging.hpp"

namespace portwire {

namespace {

// Publishes the chain of a top-level resolve so that resolves issued from
// inside a factory join it instead of starting a fresh one.
class ActiveContextGuard
{
public:
    ActiveContextGuard(ContainerState& state, ResolutionContext& context)
        : state_(state) { state_.active_context = &context; }
    ~ActiveContextGuard() { state_.active_context = nullptr; }

    ActiveContextGuard(const ActiveContextGuard&) = delete;
    ActiveContextGuard& operator=(const ActiveContextGuard&) = delete;

private:
    ContainerState& state_;
};

MemoEntrySnapshot toSnapshot(const MemoEntry& entry)
{
    return MemoEntrySnapshot{ entry.adapter->portName(), entry.adapter->lifetime(),
                              entry.resolved_at, entry.resolution_order };
}

} // namespace


Resolver::Resolver(std::shared_ptr<ContainerState> state, std::string id, std::weak_ptr<Resolver> parent)
    : state_(std::move(state)),
      id_(std::move(id)),
      parent_(std::move(parent))
{
}

Resolver::~Resolver() = default;

bool Resolver::isDisposed() const
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return disposed_;
}

size_t Resolver::childCount() const
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return children_.size();
}

void Resolver::checkActive_(const std::string& operation) const
{
    if (disposed_)
        throw DisposedResolverError(id_, operation);
}

AdapterPtr Resolver::findAdapter_(const std::string& port_name) const
{
    auto adapter = state_->graph->findAdapter(port_name);
    if (!adapter)
        throw PortNotFoundError(port_name);
    return adapter;
}

Instance Resolver::resolveErased(const PortKey& key)
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    checkActive_(fmt::format("resolve port '{}'", key.name()));

    auto adapter = findAdapter_(key.name());
    const auto provided = adapter->provides().type();
    if (key.type().valid() && provided.valid() && key.type() != provided) {
        throw PortTypeMismatchError(key.name(),
            static_cast<std::string>(provided), static_cast<std::string>(key.type()));
    }

    if (state_->active_context != nullptr)
        return resolveWith_(adapter, *state_->active_context);

    ResolutionContext context;
    ActiveContextGuard guard(*state_, context);
    return resolveWith_(adapter, context);
}

MemoMap* Resolver::memoFor_(const Adapter& adapter)
{
    switch (adapter.lifetime()) {
        case Lifetime::Singleton:
            return &state_->singletons;
        case Lifetime::Scoped:
            if (isRoot() && state_->options.scoped_from_root == ScopedFromRootPolicy::Reject)
                throw ScopeRequiredError(adapter.portName());
            return &scoped_;
        case Lifetime::Request:
            return nullptr;
    }
    return nullptr;
}

Instance Resolver::resolveWith_(const AdapterPtr& adapter, ResolutionContext& context)
{
    const auto& name = adapter->portName();
    MemoMap* memo = memoFor_(*adapter);

    ResolutionResultContext hook;
    hook.port_name = name;
    hook.lifetime = adapter->lifetime();
    hook.scope_id = isRoot() ? std::string() : id_;
    hook.parent_port = context.current();
    hook.is_cache_hit = memo != nullptr && memo->has(name);
    hook.depth = context.depth();

    const auto& hooks = state_->options.hooks;
    if (hooks) hooks->beforeResolve(hook);
    const auto start = std::chrono::steady_clock::now();

    Instance instance;
    try {
        if (hook.is_cache_hit) {
            instance = memo->find(name);
        } else {
            ResolutionContext::Frame frame(context, name);

            Dependencies deps(name);
            for (const auto& dependency : adapter->dependencies()) {
                auto provider = state_->graph->findAdapter(dependency.name());
                if (!provider)
                    throw PortNotFoundError(dependency.name(), fmt::format("required by '{}'", name));
                deps.set(provider->provides(), resolveWith_(provider, context));
            }

            instance = adapter->create(deps);
            if (memo) memo->put(adapter, instance, state_->next_resolution_order++);
        }
    } catch (...) {
        if (hooks) {
            hook.duration = std::chrono::steady_clock::now() - start;
            hook.error = std::current_exception();
            hooks->afterResolve(hook);
        }
        throw;
    }

    if (hooks) {
        hook.duration = std::chrono::steady_clock::now() - start;
        hooks->afterResolve(hook);
    }
    return instance;
}

std::shared_ptr<Scope> Resolver::createScope()
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    checkActive_("create a scope");

    auto scope_id = fmt::format("scope-{}", state_->next_scope_id++);
    std::shared_ptr<Scope> child(new Scope(state_, scope_id, weak_from_this()));
    children_.push_back(child);

    LOG_DEBUG(logTag(), "{} created {}", id_, scope_id);
    return child;
}

std::vector<MemoEntry> Resolver::releaseOwned_()
{
    return scoped_.release();
}

std::shared_future<void> Resolver::dispose()
{
    std::shared_future<void> disposal;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        if (disposal_.valid())
            return disposal_;
        disposed_ = true;

        // children are marked disposed right away; their teardown is awaited below
        std::vector<std::shared_ptr<Scope>> children;
        children.swap(children_);
        std::vector<std::shared_future<void>> pending;
        pending.reserve(children.size());
        for (auto& child : children) {
            pending.push_back(child->dispose());
        }

        auto owned = releaseOwned_();
        const char* tag = logTag();
        disposal_ = std::async(std::launch::async,
            [pending = std::move(pending), owned = std::move(owned), tag, id = id_]() mutable {
                std::vector<FinalizerFailure> failures;
                for (auto& child : pending) {
                    try {
                        child.get();
                    } catch (const FinalizerError& e) {
                        failures.insert(failures.end(), e.failures().begin(), e.failures().end());
                    }
                }

                auto own = finalizeEntries(std::move(owned), tag);
                failures.insert(failures.end(), own.begin(), own.end());

                LOG_DEBUG(tag, "{} disposed, {} finalizer failure(s)", id, failures.size());
                if (!failures.empty())
                    throw FinalizerError(std::move(failures));
            }).share();
        disposal = disposal_;
    }

    if (auto parent = parent_.lock())
        parent->removeChild_(this);
    return disposal;
}

void Resolver::removeChild_(const Resolver* child)
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    children_.erase(std::remove_if(children_.begin(), children_.end(),
        [child](const std::shared_ptr<Scope>& scope) { return scope.get() == child; }),
        children_.end());
}

bool Resolver::requiresScope(const std::string& port_name) const
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    checkActive_(fmt::format("inspect port '{}'", port_name));

    auto adapter = findAdapter_(port_name);
    return adapter->lifetime() == Lifetime::Scoped && isRoot()
        && state_->options.scoped_from_root == ScopedFromRootPolicy::Reject;
}

ResolutionStatus Resolver::isResolved(const std::string& port_name) const
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    checkActive_(fmt::format("inspect port '{}'", port_name));

    auto adapter = findAdapter_(port_name);
    switch (adapter->lifetime()) {
        case Lifetime::Singleton:
            return state_->singletons.has(port_name) ? ResolutionStatus::Resolved : ResolutionStatus::Unresolved;
        case Lifetime::Scoped:
            if (isRoot()) return ResolutionStatus::ScopeRequired;
            return scoped_.has(port_name) ? ResolutionStatus::Resolved : ResolutionStatus::Unresolved;
        case Lifetime::Request:
            return ResolutionStatus::Unresolved;
    }
    return ResolutionStatus::Unresolved;
}

ResolverState Resolver::internalState() const
{
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    checkActive_("inspect");

    ResolverState snapshot;
    snapshot.id = id_;
    snapshot.disposed = disposed_;
    for (const auto& entry : scoped_.entries()) {
        snapshot.scoped.push_back(toSnapshot(entry));
    }
    if (isRoot()) {
        for (const auto& entry : state_->singletons.entries()) {
            snapshot.singletons.push_back(toSnapshot(entry));
        }
    }
    for (const auto& child : children_) {
        if (child->isDisposed()) continue;
        snapshot.children.push_back(child->internalState());
    }
    return snapshot;
}

} // namespace portwire
