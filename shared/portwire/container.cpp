#include "container.hpp"

#include <stdexcept>

#include "logging.hpp"

namespace portwire {

std::shared_ptr<Container> Container::create(GraphPtr graph, ContainerOptions options)
{
    if (!graph)
        throw std::invalid_argument("Container::create() requires a graph");

    auto state = std::make_shared<ContainerState>(std::move(graph), std::move(options));
    std::shared_ptr<Container> container(new Container(std::move(state)));
    LOG_DEBUG(LOG_TAG, "container created with {} adapter(s)", container->graph()->size());
    return container;
}

Container::Container(std::shared_ptr<ContainerState> state)
    : Resolver(std::move(state), "container", std::weak_ptr<Resolver>())
{
}

Container::~Container()
{
    try {
        dispose().get();
    } catch (const FinalizerError& e) {
        LOGE("{} while destroying the container", e.what());
        for (const auto& failure : e.failures()) {
            LOGE("  {}: {}", failure.port_name, failure.message);
        }
    } catch (const std::exception& e) {
        LOGE("disposal failed while destroying the container: {}", e.what());
    }
}

std::vector<MemoEntry> Container::releaseOwned_()
{
    auto owned = scoped_.release();
    auto singletons = state()->singletons.release();
    owned.insert(owned.end(),
                 std::make_move_iterator(singletons.begin()),
                 std::make_move_iterator(singletons.end()));
    return owned;
}

} // namespace portwire
