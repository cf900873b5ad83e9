#pragma once
#include <memory>
#include <string>

#include "resolver.hpp"

namespace portwire {

    // Child resolution context. Owns its scoped instances and its child scopes;
    // singletons are looked up in the root container's cache.
    class Scope final : public Resolver
    {
    public:
        ~Scope() override;

        bool isRoot() const override { return false; }

        static constexpr const char* LOG_TAG = "portwire.scope";

    protected:
        const char* logTag() const override { return LOG_TAG; }

    private:
        friend class Resolver;
        Scope(std::shared_ptr<ContainerState> state, std::string id, std::weak_ptr<Resolver> parent);
    }; // class Scope

}; // namespace portwire
