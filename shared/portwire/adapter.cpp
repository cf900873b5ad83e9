#include "adapter.hpp"

namespace portwire {

Adapter::Adapter(PortKey provides,
                 std::vector<PortKey> dependencies,
                 Lifetime lifetime,
                 ErasedFactory factory,
                 ErasedFinalizer finalizer,
                 ErasedAsyncFinalizer async_finalizer)
    : provides_(std::move(provides)),
      dependencies_(std::move(dependencies)),
      lifetime_(lifetime),
      factory_(std::move(factory)),
      finalizer_(std::move(finalizer)),
      async_finalizer_(std::move(async_finalizer))
{
    if (!factory_)
        throw std::invalid_argument("adapter for '" + provides_.name() + "' has no factory");
}

Instance Adapter::create(const Dependencies& deps) const
{
    Instance instance;
    try {
        instance = factory_(deps);
    } catch (const ContainerError&) {
        throw;
    } catch (const std::exception& e) {
        throw FactoryError(provides_.name(), e.what());
    } catch (...) {
        throw FactoryError(provides_.name(), "unknown exception");
    }

    if (!instance)
        throw FactoryError(provides_.name(), "factory returned nullptr");
    return instance;
}

void Adapter::finalize(const Instance& instance) const
{
    if (async_finalizer_) {
        auto pending = async_finalizer_(instance);
        if (pending.valid()) pending.get();
        return;
    }
    if (finalizer_) finalizer_(instance);
}

} // namespace portwire
