#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <stdexcept>

#include "tracing_container.hpp"
#include "composite_collector.hpp"
#include "fixtures.hpp"

using namespace portwire;
using namespace portwire::fixtures;
using namespace portwire::tracing;
using ::testing::ElementsAre;

namespace {

const TraceEntry& entryFor(const std::vector<TraceEntry>& traces, const std::string& port_name)
{
    auto it = std::find_if(traces.begin(), traces.end(),
        [&port_name](const TraceEntry& entry) { return entry.port_name == port_name; });
    if (it == traces.end()) throw std::out_of_range("no trace for " + port_name);
    return *it;
}

} // namespace

TEST(TracingTest, NestedResolutionProducesLinkedEntries)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    auto scope = traced->createScope();

    (void)scope->resolve(UserServicePort);

    auto traces = traced->getTraces();
    ASSERT_EQ(traces.size(), 2u);

    const auto& users = entryFor(traces, "UserService");
    const auto& logger = entryFor(traces, "Logger");

    EXPECT_EQ(users.id, "trace-1");
    EXPECT_EQ(logger.id, "trace-2");
    EXPECT_FALSE(users.parent_trace_id.has_value());
    ASSERT_TRUE(logger.parent_trace_id.has_value());
    EXPECT_EQ(*logger.parent_trace_id, users.id);
    EXPECT_THAT(users.child_trace_ids, ElementsAre(logger.id));

    EXPECT_EQ(logger.order, 1u);
    EXPECT_EQ(users.order, 2u);
    EXPECT_EQ(users.lifetime, Lifetime::Scoped);
    EXPECT_EQ(logger.lifetime, Lifetime::Singleton);
    EXPECT_EQ(users.scope_id, "scope-0");
    EXPECT_FALSE(users.is_cache_hit);
    EXPECT_FALSE(users.failed);

    EXPECT_EQ(traced->getStats().total_resolutions, 2u);
}

TEST(TracingTest, CacheHitsAndStats)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());

    (void)traced->resolve(LoggerPort);
    (void)traced->resolve(LoggerPort);

    auto traces = traced->getTraces();
    ASSERT_EQ(traces.size(), 2u);
    EXPECT_FALSE(traces[0].is_cache_hit);
    EXPECT_TRUE(traces[1].is_cache_hit);
    EXPECT_EQ(traces[0].scope_id, "");

    auto stats = traced->getStats();
    EXPECT_EQ(stats.total_resolutions, 2u);
    EXPECT_DOUBLE_EQ(stats.cache_hit_rate, 0.5);
    EXPECT_EQ(stats.slow_count, 0u);
    EXPECT_LE(stats.session_start, traces[0].start_time);
}

TEST(TracingTest, PauseAndResume)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    auto scope = traced->createScope();

    traced->pause();
    EXPECT_TRUE(traced->isPaused());
    (void)scope->resolve(UserServicePort);
    EXPECT_TRUE(traced->getTraces().empty());

    traced->resume();
    EXPECT_FALSE(traced->isPaused());
    (void)scope->resolve(UserServicePort);

    auto traces = traced->getTraces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_TRUE(traces[0].is_cache_hit);
    EXPECT_FALSE(traces[0].parent_trace_id.has_value());
}

TEST(TracingTest, ClearRestartsNumbering)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    (void)traced->resolve(LoggerPort);
    (void)traced->resolve(LoggerPort);

    traced->clear();
    EXPECT_TRUE(traced->getTraces().empty());

    (void)traced->resolve(LoggerPort);
    auto traces = traced->getTraces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].id, "trace-1");
    EXPECT_EQ(traces[0].order, 1u);
}

TEST(TracingTest, SubscribersSeeEveryEntry)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    std::vector<std::string> seen;
    auto subscription = traced->subscribe([&seen](const TraceEntry& entry) { seen.push_back(entry.port_name); });

    (void)traced->createScope()->resolve(UserServicePort);
    EXPECT_THAT(seen, ElementsAre("Logger", "UserService"));

    EXPECT_TRUE(subscription->unsubscribe());
    (void)traced->resolve(LoggerPort);
    EXPECT_EQ(seen.size(), 2u);

    auto again = subscription->unsubscribe();
    EXPECT_EQ(again.code(), ResultCode::NotFound);
}

TEST(TracingTest, Filters)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    auto scope = traced->createScope();
    (void)scope->resolve(UserServicePort);
    (void)traced->resolve(LoggerPort);

    TraceFilter by_name;
    by_name.port_name = "userserv";
    EXPECT_EQ(traced->getTraces(by_name).size(), 1u);

    TraceFilter root_only;
    root_only.scope_id = "";
    auto root = traced->getTraces(root_only);
    ASSERT_EQ(root.size(), 1u);
    EXPECT_EQ(root[0].port_name, "Logger");

    TraceFilter hits;
    hits.is_cache_hit = true;
    EXPECT_EQ(traced->getTraces(hits).size(), 1u);

    TraceFilter singletons;
    singletons.lifetime = Lifetime::Singleton;
    EXPECT_EQ(traced->getTraces(singletons).size(), 2u);

    TraceFilter slow;
    slow.min_duration_ms = 60000;
    EXPECT_TRUE(traced->getTraces(slow).empty());
}

TEST(TracingTest, PinAndUnpin)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    (void)traced->resolve(LoggerPort);

    EXPECT_TRUE(traced->pin("trace-1"));
    TraceFilter pinned;
    pinned.is_pinned = true;
    EXPECT_EQ(traced->getTraces(pinned).size(), 1u);

    EXPECT_TRUE(traced->unpin("trace-1"));
    EXPECT_TRUE(traced->getTraces(pinned).empty());

    auto missing = traced->pin("trace-42");
    EXPECT_EQ(missing.code(), ResultCode::NotFound);
    EXPECT_STREQ(missing.c_str(), "no trace with id trace-42");
}

TEST(TracingTest, FailedResolutionsAreRecorded)
{
    auto graph = GraphBuilder::create()
        .provide(makeAdapter(LoggerPort)
            .factory([](const Dependencies&) -> std::shared_ptr<Logger> { throw std::runtime_error("no tty"); })
            .build())
        .build();
    auto traced = TracingContainer::create(graph);

    EXPECT_THROW((void)traced->resolve(LoggerPort), FactoryError);

    auto traces = traced->getTraces();
    ASSERT_EQ(traces.size(), 1u);
    EXPECT_TRUE(traces[0].failed);
}

TEST(TracingTest, ScopedFromRootPolicyIsForwarded)
{
    TracingOptions options;
    options.scoped_from_root = ScopedFromRootPolicy::Allow;
    auto traced = TracingContainer::create(loggerUserServiceGraph(), options);

    EXPECT_NE(traced->resolve(UserServicePort), nullptr);
    EXPECT_EQ(traced->getStats().total_resolutions, 2u);
}

TEST(TracingTest, CustomCollectorReceivesEntries)
{
    auto primary = std::make_shared<MemoryCollector>();
    auto mirror = std::make_shared<MemoryCollector>();
    TracingOptions options;
    options.collector = std::make_shared<CompositeCollector>(
        std::vector<std::shared_ptr<TraceCollector>>{ primary, mirror });
    auto traced = TracingContainer::create(loggerUserServiceGraph(), options);

    (void)traced->resolve(LoggerPort);

    EXPECT_EQ(primary->size(), 1u);
    EXPECT_EQ(mirror->size(), 1u);
    EXPECT_EQ(traced->getTraces().size(), 1u);
}

TEST(TracingTest, DisposeDelegatesToTheContainer)
{
    auto traced = TracingContainer::create(loggerUserServiceGraph());
    traced->dispose().get();
    EXPECT_TRUE(traced->isDisposed());
    EXPECT_THROW((void)traced->resolve(LoggerPort), DisposedResolverError);
}

TEST(TracerTest, RequiresACollector)
{
    EXPECT_THROW(Tracer(nullptr), std::invalid_argument);
}
