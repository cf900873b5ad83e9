#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <stdexcept>

#include "container.hpp"
#include "fixtures.hpp"

using namespace portwire;
using namespace portwire::fixtures;

TEST(ContainerTest, LoggerAndUserServiceScenario)
{
    auto container = Container::create(loggerUserServiceGraph());

    auto logger = container->resolve(LoggerPort);
    EXPECT_EQ(container->resolve(LoggerPort), logger);

    auto first = container->createScope()->resolve(UserServicePort);
    auto second = container->createScope()->resolve(UserServicePort);
    EXPECT_NE(first, second);
    EXPECT_EQ(first->logger, logger);
    EXPECT_EQ(second->logger, logger);
}

TEST(ContainerTest, SingletonIsSharedAcrossScopes)
{
    auto container = Container::create(loggerUserServiceGraph());
    auto scope_a = container->createScope();
    auto scope_b = container->createScope();
    auto nested = scope_a->createScope();

    auto logger = scope_a->resolve(LoggerPort);
    EXPECT_EQ(scope_b->resolve(LoggerPort), logger);
    EXPECT_EQ(nested->resolve(LoggerPort), logger);
    EXPECT_EQ(container->resolve(LoggerPort), logger);
}

TEST(ContainerTest, RequestLifetimeIsAlwaysFresh)
{
    auto graph = GraphBuilder::create().provide(loggerAdapter(Lifetime::Request)).build();
    auto container = Container::create(graph);
    auto scope = container->createScope();

    EXPECT_NE(container->resolve(LoggerPort), container->resolve(LoggerPort));
    EXPECT_NE(scope->resolve(LoggerPort), scope->resolve(LoggerPort));
}

TEST(ContainerTest, ScopedIsPerScope)
{
    auto container = Container::create(loggerUserServiceGraph());
    auto scope = container->createScope();
    auto sibling = container->createScope();
    auto nested = scope->createScope();

    auto users = scope->resolve(UserServicePort);
    EXPECT_EQ(scope->resolve(UserServicePort), users);
    EXPECT_NE(sibling->resolve(UserServicePort), users);
    EXPECT_NE(nested->resolve(UserServicePort), users);
}

TEST(ContainerTest, RequestDependencyIsFreshPerDependent)
{
    auto graph = GraphBuilder::create()
        .provide(loggerAdapter(Lifetime::Request))
        .provide(userServiceAdapter(Lifetime::Request))
        .build();
    auto container = Container::create(graph);

    auto a = container->resolve(UserServicePort);
    auto b = container->resolve(UserServicePort);
    EXPECT_NE(a->logger, b->logger);
}

TEST(ContainerTest, UnknownPort)
{
    auto container = Container::create(loggerUserServiceGraph());
    try {
        (void)container->resolve(DatabasePort);
        FAIL() << "expected PortNotFoundError";
    } catch (const PortNotFoundError& e) {
        EXPECT_EQ(e.port(), "Database");
        EXPECT_EQ(e.code(), ResultCode::NotFound);
        EXPECT_STREQ(e.codeName(), "PORT_NOT_FOUND");
        EXPECT_STREQ(e.what(), "Port 'Database' is not registered in this container");
    }
}

TEST(ContainerTest, PortTypeMustMatchTheAdapter)
{
    auto container = Container::create(loggerUserServiceGraph());
    EXPECT_THROW((void)container->resolve(Port<Database>("Logger")), PortTypeMismatchError);
}

TEST(ContainerTest, ErasedResolveWithoutTypeSkipsTheCheck)
{
    auto container = Container::create(loggerUserServiceGraph());
    auto erased = container->resolveErased(PortKey("Logger", TypeId{}));
    EXPECT_EQ(erased, std::static_pointer_cast<void>(container->resolve(LoggerPort)));
}

TEST(ContainerTest, FailedFactoryIsNotCached)
{
    std::atomic<int> attempts{0};
    auto graph = GraphBuilder::create()
        .provide(makeAdapter(LoggerPort)
            .factory([&attempts](const Dependencies&) -> std::shared_ptr<Logger> {
                if (++attempts == 1) throw std::runtime_error("not yet");
                return std::make_shared<Logger>();
            })
            .build())
        .build();
    auto container = Container::create(graph);

    EXPECT_THROW((void)container->resolve(LoggerPort), FactoryError);
    EXPECT_EQ(container->isResolved("Logger"), ResolutionStatus::Unresolved);
    EXPECT_NE(container->resolve(LoggerPort), nullptr);
    EXPECT_EQ(attempts.load(), 2);
}

TEST(ContainerTest, FactoryErrorNamesTheFailingPort)
{
    auto graph = GraphBuilder::create()
        .provide(makeAdapter(LoggerPort)
            .factory([](const Dependencies&) -> std::shared_ptr<Logger> { throw std::runtime_error("disk full"); })
            .build())
        .provide(userServiceAdapter(Lifetime::Request))
        .build();
    auto container = Container::create(graph);

    try {
        (void)container->resolve(UserServicePort);
        FAIL() << "expected FactoryError";
    } catch (const FactoryError& e) {
        EXPECT_EQ(e.port(), "Logger");
        EXPECT_EQ(e.cause(), "disk full");
    }
}

TEST(ContainerTest, Identity)
{
    auto container = Container::create(loggerUserServiceGraph());
    auto scope = container->createScope();
    auto nested = scope->createScope();
    auto sibling = container->createScope();

    EXPECT_EQ(container->id(), "container");
    EXPECT_TRUE(container->isRoot());
    EXPECT_EQ(scope->id(), "scope-0");
    EXPECT_EQ(nested->id(), "scope-1");
    EXPECT_EQ(sibling->id(), "scope-2");
    EXPECT_FALSE(scope->isRoot());

    EXPECT_EQ(scope->parent(), container);
    EXPECT_EQ(nested->parent(), scope);
    EXPECT_EQ(container->parent(), nullptr);
    EXPECT_EQ(container->childCount(), 2u);
    EXPECT_EQ(scope->childCount(), 1u);
}

TEST(ContainerTest, RequiresAGraph)
{
    EXPECT_THROW(Container::create(nullptr), std::invalid_argument);
}

TEST(ContainerTest, GraphIsShareableBetweenContainers)
{
    auto graph = loggerUserServiceGraph();
    auto a = Container::create(graph);
    auto b = Container::create(graph);

    EXPECT_EQ(a->graph(), b->graph());
    EXPECT_NE(a->resolve(LoggerPort), b->resolve(LoggerPort));
}
