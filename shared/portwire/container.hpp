#pragma once
#include <memory>

#include "resolver.hpp"
#include "scope.hpp"

namespace portwire {

    // Root resolution context bound to one graph. Owns the singleton cache.
    class Container final : public Resolver
    {
    public:
        static std::shared_ptr<Container> create(GraphPtr graph, ContainerOptions options = {});

        // Disposes the tree if that has not happened yet and waits for it.
        ~Container() override;

        bool isRoot() const override { return true; }
        const ContainerOptions& options() const { return state()->options; }

        static constexpr const char* LOG_TAG = "portwire.container";

    protected:
        const char* logTag() const override { return LOG_TAG; }

        // scoped instances held under ScopedFromRootPolicy::Allow plus the singletons
        std::vector<MemoEntry> releaseOwned_() override;

    private:
        explicit Container(std::shared_ptr<ContainerState> state);
    }; // class Container

    using ContainerPtr = std::shared_ptr<Container>;

}; // namespace portwire
