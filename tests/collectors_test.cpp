#include <gtest/gtest.h>

#include "composite_collector.hpp"
#include "memory_collector.hpp"
#include "noop_collector.hpp"

using namespace portwire;
using namespace portwire::tracing;

namespace {

TraceEntry makeEntry(const std::string& id)
{
    TraceEntry entry;
    entry.id = id;
    entry.port_name = "Logger";
    entry.duration = Milliseconds(1);
    return entry;
}

} // namespace

TEST(NoOpCollectorTest, DiscardsEverything)
{
    NoOpCollector collector;
    int calls = 0;
    auto subscription = collector.subscribe([&calls](const TraceEntry&) { ++calls; });

    collector.collect(makeEntry("trace-1"));

    EXPECT_TRUE(collector.getTraces().empty());
    EXPECT_EQ(collector.getStats().total_resolutions, 0u);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(collector.pin("trace-1").code(), ResultCode::NotFound);
    EXPECT_TRUE(subscription->unsubscribe());
}

TEST(CompositeCollectorTest, FansOutAndReadsFromTheFirst)
{
    auto first = std::make_shared<MemoryCollector>();
    auto second = std::make_shared<MemoryCollector>();
    CompositeCollector composite({ first, nullptr, second });
    EXPECT_EQ(composite.size(), 2u);

    int calls = 0;
    auto subscription = composite.subscribe([&calls](const TraceEntry&) { ++calls; });

    composite.collect(makeEntry("trace-1"));
    EXPECT_EQ(first->size(), 1u);
    EXPECT_EQ(second->size(), 1u);
    EXPECT_EQ(composite.getTraces().size(), 1u);
    EXPECT_EQ(composite.getStats().total_resolutions, 1u);
    EXPECT_EQ(calls, 1);

    EXPECT_TRUE(composite.pin("trace-1"));
    EXPECT_TRUE(first->getTraces()[0].is_pinned);
    EXPECT_TRUE(second->getTraces()[0].is_pinned);
    EXPECT_TRUE(composite.unpin("trace-1"));
    EXPECT_FALSE(second->getTraces()[0].is_pinned);

    composite.clear();
    EXPECT_EQ(first->size(), 0u);
    EXPECT_EQ(second->size(), 0u);
}

TEST(CompositeCollectorTest, PinResultComesFromTheFirst)
{
    auto first = std::make_shared<MemoryCollector>();
    auto second = std::make_shared<MemoryCollector>();
    CompositeCollector composite({ first, second });

    second->collect(makeEntry("trace-7"));
    EXPECT_EQ(composite.pin("trace-7").code(), ResultCode::NotFound);
    EXPECT_TRUE(second->getTraces()[0].is_pinned);
}

TEST(CompositeCollectorTest, EmptyComposite)
{
    CompositeCollector composite(std::vector<std::shared_ptr<TraceCollector>>{});
    composite.collect(makeEntry("trace-1"));

    EXPECT_TRUE(composite.getTraces().empty());
    EXPECT_EQ(composite.getStats().total_resolutions, 0u);
    EXPECT_EQ(composite.pin("trace-1").code(), ResultCode::NotFound);

    auto subscription = composite.subscribe([](const TraceEntry&) {});
    ASSERT_NE(subscription, nullptr);
    EXPECT_TRUE(subscription->unsubscribe());
}
