#include <iostream>
#include <string>

#include "logging.hpp"
#include "container_config.hpp"
#include "graph_builder.hpp"
#include "graph_export.hpp"
#include "inspector.hpp"
#include "tracing_container.hpp"

using namespace portwire;

static constexpr const char* TAG = "portwire.demo";

namespace {

class AppLogger {
public:
    void log(const std::string& message) { LOG_INFO(TAG, "[app] {}", message); }
};

class UserService {
public:
    explicit UserService(std::shared_ptr<AppLogger> logger) : logger_(std::move(logger)) {}

    std::string find(int id) {
        logger_->log(fmt::format("lookup user {}", id));
        return fmt::format("user-{}", id);
    }

private:
    std::shared_ptr<AppLogger> logger_;
};

class RequestContext {
public:
    explicit RequestContext(std::string id) : id_(std::move(id)) {}
    const std::string& id() const { return id_; }

private:
    std::string id_;
};

const Port<AppLogger> LoggerPort("Logger");
const Port<UserService> UserServicePort("UserService");
const Port<RequestContext> RequestContextPort("RequestContext");

GraphPtr buildGraph()
{
    auto logger = makeAdapter(LoggerPort)
        .lifetime(Lifetime::Singleton)
        .factory([](const Dependencies&) { return std::make_shared<AppLogger>(); })
        .finalizer([](AppLogger& l) { l.log("logger finalized"); })
        .build();

    auto users = makeAdapter(UserServicePort)
        .dependsOn(LoggerPort)
        .lifetime(Lifetime::Scoped)
        .factory([](const Dependencies& deps) {
            return std::make_shared<UserService>(deps.get(LoggerPort));
        })
        .build();

    auto request = makeAdapter(RequestContextPort)
        .lifetime(Lifetime::Request)
        .factory([](const Dependencies&) {
            static int counter = 0;
            return std::make_shared<RequestContext>(fmt::format("req-{}", ++counter));
        })
        .build();

    return GraphBuilder::create()
        .provide(logger)
        .provide(users)
        .provide(request)
        .build();
}

} // namespace

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "config/portwire.yaml";

    auto config = ContainerConfig::load(path);
    if (!config) {
        std::cerr << "config: " << config.error().value_or("unknown error") << std::endl;
        return 1;
    }
    auto res = config.value().applyLogging();
    if (!res) {
        std::cerr << "logging: " << to_string(res) << std::endl;
        return 1;
    }

    LOG_INFO(TAG, "demo start (config {})", path);

    try {
        auto graph = buildGraph();
        auto traced = tracing::TracingContainer::create(graph, config.value().tracingOptions());
        if (!config.value().tracing.enabled) traced->pause();

        auto subscription = traced->subscribe([](const tracing::TraceEntry& entry) {
            LOG_DEBUG(TAG, "{} {} {:.3f}ms{}", entry.id, entry.port_name, entry.duration.count(),
                      entry.is_cache_hit ? " (cached)" : "");
        });

        for (int request = 1; request <= 2; ++request) {
            auto scope = traced->createScope();
            auto users = scope->resolve(UserServicePort);
            auto context = scope->resolve(RequestContextPort);
            LOG_INFO(TAG, "{} in {}: {}", context->id(), scope->id(), users->find(request));
            scope->dispose().get();
        }

        Inspector inspector(traced->container());
        for (const auto& entry : inspector.snapshot().singletons) {
            LOG_INFO(TAG, "singleton {} resolved={}", entry.port_name, entry.is_resolved);
        }

        auto stats = traced->getStats();
        std::cout << fmt::format("resolutions: {}, avg {:.3f}ms, cache hit rate {:.0f}%, slow {}",
                                 stats.total_resolutions, stats.average_duration_ms,
                                 stats.cache_hit_rate * 100, stats.slow_count) << std::endl;

        DotOptions dot;
        dot.direction = DotOptions::Direction::LR;
        dot.preset = DotOptions::Preset::Styled;
        std::cout << toDot(toExportedGraph(*graph), dot) << std::endl;

        res = subscription->unsubscribe();
        if (!res) LOG_WARN(TAG, "unsubscribe: {}", to_string(res));

        traced->dispose().get();
    } catch (const ContainerError& e) {
        LOG_ERROR(TAG, "{}: {}", e.codeName(), e.what());
        logging::Logger::instance().flush();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(TAG, "{}", e.what());
        logging::Logger::instance().flush();
        return 1;
    }

    LOG_INFO(TAG, "demo done");
    logging::Logger::instance().flush();
    return 0;
}
