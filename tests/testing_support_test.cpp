#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "container.hpp"
#include "errors.hpp"
#include "graph_assertions.hpp"
#include "test_graph_builder.hpp"
#include "fixtures.hpp"

using namespace portwire::fixtures;
using portwire::AdapterPtr;
using portwire::Container;
using portwire::GraphBuilder;
using portwire::Lifetime;
using portwire::MissingDependencyError;
using portwire::testing::GraphAssertionError;
using portwire::testing::TestGraphBuilder;
using portwire::testing::createMockAdapter;
using ::testing::ElementsAre;

namespace {

std::vector<std::string> portOrder(const portwire::Graph& graph)
{
    std::vector<std::string> names;
    for (const auto& adapter : graph.adapters()) names.push_back(adapter->portName());
    return names;
}

} // namespace

TEST(TestGraphBuilderTest, OverrideReplacesTheAdapterInPlace)
{
    auto fake = std::make_shared<Logger>();
    fake->log("preloaded");

    auto graph = TestGraphBuilder::from(loggerUserServiceGraph())
        .override(createMockAdapter(LoggerPort, fake))
        .build();

    EXPECT_THAT(portOrder(*graph), ElementsAre("Logger", "UserService"));
    EXPECT_EQ(graph->findAdapter("Logger")->lifetime(), Lifetime::Request);

    auto container = Container::create(graph);
    auto scope = container->createScope();
    auto users = scope->resolve(UserServicePort);
    EXPECT_EQ(users->logger, fake);
    EXPECT_THAT(users->logger->lines, ElementsAre("preloaded"));
}

TEST(TestGraphBuilderTest, OriginalGraphIsUntouched)
{
    auto original = loggerUserServiceGraph();
    auto original_logger = original->findAdapter("Logger");

    auto builder = TestGraphBuilder::from(original);
    auto overridden = builder.override(createMockAdapter(LoggerPort, std::make_shared<Logger>()));

    EXPECT_EQ(builder.overrideCount(), 0u);
    EXPECT_EQ(overridden.overrideCount(), 1u);

    (void)overridden.build();
    EXPECT_EQ(original->findAdapter("Logger"), original_logger);
}

TEST(TestGraphBuilderTest, LastOverrideWins)
{
    auto first = std::make_shared<Logger>();
    auto second = std::make_shared<Logger>();

    auto graph = TestGraphBuilder::from(loggerUserServiceGraph())
        .override(createMockAdapter(LoggerPort, first))
        .override(createMockAdapter(LoggerPort, second, Lifetime::Singleton))
        .build();

    auto container = Container::create(graph);
    EXPECT_EQ(container->resolve(LoggerPort), second);
}

TEST(TestGraphBuilderTest, UnknownPortOverrideIsIgnored)
{
    auto builder = TestGraphBuilder::from(loggerUserServiceGraph())
        .override(createMockAdapter(DatabasePort, std::make_shared<Database>()));
    EXPECT_EQ(builder.overrideCount(), 1u);

    auto graph = builder.build();
    EXPECT_FALSE(graph->contains("Database"));
    EXPECT_EQ(graph->size(), 2u);
}

TEST(TestGraphBuilderTest, OverrideWithUnmetDependencyFailsToBuild)
{
    auto needy = makeAdapter(LoggerPort)
        .dependsOn(DatabasePort)
        .factory([](const portwire::Dependencies&) { return std::make_shared<Logger>(); })
        .build();

    auto builder = TestGraphBuilder::from(loggerUserServiceGraph()).override(needy);
    EXPECT_THROW((void)builder.build(), MissingDependencyError);
}

TEST(TestGraphBuilderTest, NullArguments)
{
    EXPECT_THROW(TestGraphBuilder::from(nullptr), std::invalid_argument);
    EXPECT_THROW((void)TestGraphBuilder::from(loggerUserServiceGraph()).override(AdapterPtr()),
                 std::invalid_argument);
}

TEST(GraphAssertionsTest, CompleteGraphPasses)
{
    auto graph = loggerUserServiceGraph();
    EXPECT_NO_THROW(portwire::testing::assertGraphComplete(*graph));
    EXPECT_NO_THROW(portwire::testing::assertPortProvided(*graph, LoggerPort));
    EXPECT_NO_THROW(portwire::testing::assertLifetime(*graph, UserServicePort, Lifetime::Scoped));
}

TEST(GraphAssertionsTest, PortNotProvided)
{
    auto graph = loggerUserServiceGraph();
    try {
        portwire::testing::assertPortProvided(*graph, DatabasePort);
        FAIL() << "expected GraphAssertionError";
    } catch (const GraphAssertionError& e) {
        EXPECT_STREQ(e.what(), "Port 'Database' is not provided in graph");
        EXPECT_STREQ(e.code(), "GRAPH_ASSERTION_FAILED");
        EXPECT_THAT(e.portNames(), ElementsAre("Database"));
    }

    EXPECT_THROW(portwire::testing::assertLifetime(*graph, DatabasePort, Lifetime::Singleton),
                 GraphAssertionError);
}

TEST(GraphAssertionsTest, WrongLifetime)
{
    auto graph = loggerUserServiceGraph();
    try {
        portwire::testing::assertLifetime(*graph, LoggerPort, Lifetime::Scoped);
        FAIL() << "expected GraphAssertionError";
    } catch (const GraphAssertionError& e) {
        EXPECT_STREQ(e.what(), "Port 'Logger' has lifetime 'singleton', expected 'scoped'");
        EXPECT_THAT(e.portNames(), ElementsAre("Logger"));
    }
}

TEST(GraphAssertionsTest, OverriddenLifetimeIsVisible)
{
    auto graph = TestGraphBuilder::from(loggerUserServiceGraph())
        .override(createMockAdapter(LoggerPort, std::make_shared<Logger>()))
        .build();

    portwire::testing::assertGraphComplete(*graph);
    EXPECT_THROW(portwire::testing::assertLifetime(*graph, LoggerPort, Lifetime::Singleton),
                 GraphAssertionError);
}
