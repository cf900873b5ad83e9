#include "scope.hpp"

namespace portwire {

Scope::Scope(std::shared_ptr<ContainerState> state, std::string id, std::weak_ptr<Resolver> parent)
    : Resolver(std::move(state), std::move(id), std::move(parent))
{
}

// A scope is only released by its parent after dispose(), or together with a
// root container whose destructor already disposed the whole tree.
Scope::~Scope() = default;

} // namespace portwire
