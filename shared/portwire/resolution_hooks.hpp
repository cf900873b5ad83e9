#pragma once
#include <chrono>
#include <exception>
#include <memory>
#include <string>

#include "lifetime.hpp"

namespace portwire {

    using Milliseconds = std::chrono::duration<double, std::milli>;

    struct ResolutionHookContext {
        std::string port_name;
        Lifetime lifetime = Lifetime::Singleton;
        std::string scope_id;       // empty for the root container
        std::string parent_port;    // empty for a top-level resolve
        bool is_cache_hit = false;
        size_t depth = 0;
    };

    struct ResolutionResultContext : ResolutionHookContext {
        Milliseconds duration{0};
        std::exception_ptr error;   // set when the resolution failed
    };

    // Observer of every resolve, nested ones included.
    class ResolutionHooks
    {
    public:
        virtual ~ResolutionHooks() = default;
        virtual void beforeResolve(const ResolutionHookContext& context) = 0;
        virtual void afterResolve(const ResolutionResultContext& context) = 0;
    }; // interface ResolutionHooks


    // What the root container does with a scoped port requested directly.
    enum class ScopedFromRootPolicy
    {
        Reject,     // ScopeRequiredError
        Allow,      // the root acts as its own implicit scope
    };

    struct ContainerOptions {
        ScopedFromRootPolicy scoped_from_root = ScopedFromRootPolicy::Reject;
        std::shared_ptr<ResolutionHooks> hooks;
    };

}; // namespace portwire
