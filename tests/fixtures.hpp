#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "graph_builder.hpp"

namespace portwire::fixtures {

class Logger {
public:
    void log(const std::string& line) { lines.push_back(line); }
    std::vector<std::string> lines;
};

class Database {
public:
    explicit Database(std::string dsn = "memory") : dsn(std::move(dsn)) {}
    std::string dsn;
};

class UserService {
public:
    explicit UserService(std::shared_ptr<Logger> logger) : logger(std::move(logger)) {}
    std::shared_ptr<Logger> logger;
};

// generic service for graphs built from port names
struct Component {
    explicit Component(std::string name) : name(std::move(name)) {}
    std::string name;
};

inline const Port<Logger> LoggerPort{"Logger"};
inline const Port<Database> DatabasePort{"Database"};
inline const Port<UserService> UserServicePort{"UserService"};

inline Port<Component> componentPort(const std::string& name) {
    return Port<Component>(name);
}

inline AdapterPtr loggerAdapter(Lifetime lifetime = Lifetime::Singleton)
{
    return makeAdapter(LoggerPort)
        .lifetime(lifetime)
        .factory([](const Dependencies&) { return std::make_shared<Logger>(); })
        .build();
}

inline AdapterPtr userServiceAdapter(Lifetime lifetime = Lifetime::Scoped)
{
    return makeAdapter(UserServicePort)
        .dependsOn(LoggerPort)
        .lifetime(lifetime)
        .factory([](const Dependencies& deps) {
            return std::make_shared<UserService>(deps.get(LoggerPort));
        })
        .build();
}

// Logger (singleton) <- UserService (scoped)
inline GraphPtr loggerUserServiceGraph()
{
    return GraphBuilder::create()
        .provide(loggerAdapter())
        .provide(userServiceAdapter())
        .build();
}

// Thread-safe record of finalized port names; sibling scopes finalize on
// different threads.
class FinalizeLog {
public:
    void record(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        names_.push_back(name);
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return names_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> names_;
};

// Component adapter whose finalizer writes its port name into `log`.
inline AdapterPtr componentAdapter(const std::string& name,
                                   Lifetime lifetime,
                                   std::shared_ptr<FinalizeLog> log = nullptr,
                                   const std::vector<std::string>& dependencies = {})
{
    auto builder = makeAdapter(componentPort(name));
    for (const auto& dependency : dependencies) {
        builder.dependsOn(componentPort(dependency));
    }
    builder.lifetime(lifetime)
        .factory([name](const Dependencies&) { return std::make_shared<Component>(name); });
    if (log) {
        builder.finalizer([log](Component& component) { log->record(component.name); });
    }
    return builder.build();
}

}; // namespace portwire::fixtures
