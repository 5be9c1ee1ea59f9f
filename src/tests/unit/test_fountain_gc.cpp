//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the mark-sweep collector: unreachable cycles are reclaimed,
// reachable objects survive, and automatic collection keeps the heap bounded
// without disturbing program results.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fountain/Runner.hpp"
#include "interp/Heap.hpp"
#include "interp/Table.hpp"

#include <sstream>

using fountain::RunConfig;
using fountain::Runner;

namespace
{

RunConfig quietConfig(std::ostringstream &out)
{
    RunConfig config;
    config.output = &out;
    config.standardBuiltins = false;
    return config;
}

} // namespace

TEST(FountainGc, HeapCollectFreesUnmarkedObjects)
{
    using namespace fountain::interp;
    Heap heap;
    Table *kept = heap.make<Table>();
    Table *child = heap.make<Table>();
    kept->set(Value::number(0), Value::table(child));
    heap.make<Table>();
    EXPECT_EQ(heap.liveCount(), 3u);

    const size_t freed = heap.collect([&](GcMarker &marker) { marker.mark(kept); });
    EXPECT_EQ(freed, 1u);
    EXPECT_EQ(heap.liveCount(), 2u);
    EXPECT_EQ(heap.allocatedSinceCollect(), 0u);
}

TEST(FountainGc, FreshRunnerHoldsOnlyItsGlobals)
{
    std::ostringstream out;
    Runner bare(quietConfig(out));
    EXPECT_EQ(bare.liveObjectCount(), 1u);

    Runner standard;
    EXPECT_EQ(standard.liveObjectCount(), 5u);
    EXPECT_EQ(standard.collectGarbage(), 0u);
}

TEST(FountainGc, UnreachableCycleIsFreed)
{
    std::ostringstream out;
    Runner runner(quietConfig(out));
    ASSERT_TRUE(runner.run("a = {}\nb = {a = a}\na.b = b\na = nil\nb = nil\n").ok());
    EXPECT_EQ(runner.liveObjectCount(), 3u);
    EXPECT_EQ(runner.collectGarbage(), 2u);
    EXPECT_EQ(runner.liveObjectCount(), 1u);
}

TEST(FountainGc, SelfReferenceReachableFromGlobalSurvives)
{
    std::ostringstream out;
    Runner runner(quietConfig(out));
    ASSERT_TRUE(runner.run("t = {}\nt.self = t\n").ok());
    EXPECT_EQ(runner.collectGarbage(), 0u);
    ASSERT_TRUE(runner.run("print t.self.self == t").ok());
    EXPECT_EQ(out.str(), "true\n");
}

TEST(FountainGc, DroppedClosureReleasesItsEnvironment)
{
    std::ostringstream out;
    Runner runner(quietConfig(out));
    ASSERT_TRUE(runner.run("fn make() fn inner() end return inner end\n"
                           "f = make()\n")
                    .ok());
    // globals, make, make's call frame, inner
    EXPECT_EQ(runner.liveObjectCount(), 4u);
    EXPECT_EQ(runner.collectGarbage(), 0u);

    ASSERT_TRUE(runner.run("f = nil").ok());
    EXPECT_EQ(runner.collectGarbage(), 2u);
    EXPECT_EQ(runner.liveObjectCount(), 2u);
}

TEST(FountainGc, LastExpressionValueStaysAlive)
{
    std::ostringstream out;
    Runner runner(quietConfig(out));
    auto result = runner.run("{1, 2, 3}");
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.lastValue.isTable());
    EXPECT_EQ(runner.collectGarbage(), 0u);
    EXPECT_EQ(result.lastValue.asTable()->size(), 3u);
}

TEST(FountainGc, ThresholdBoundsLiveObjects)
{
    std::ostringstream out;
    RunConfig config = quietConfig(out);
    config.interpreter.gcThreshold = 64;
    Runner runner(config);

    auto result = runner.run("i = 0\n"
                             "for do\n"
                             "  i += 1\n"
                             "  t = {i, {i}}\n"
                             "  if i >= 1000 do break end\n"
                             "end\n"
                             "print i\n");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(out.str(), "1000\n");
    EXPECT_LE(runner.liveObjectCount(), 72u);
}

TEST(FountainGc, CollectingAtEveryStatementKeepsResults)
{
    std::ostringstream out;
    RunConfig config = quietConfig(out);
    config.interpreter.gcThreshold = 0;
    Runner runner(config);

    auto result = runner.run("fn fib(n)\n"
                             "  if n < 2 do return n end\n"
                             "  return fib(n - 1) + fib(n - 2)\n"
                             "end\n"
                             "memo = {}\n"
                             "fn get(n) memo[n] = {value = fib(n)} return memo[n].value end\n"
                             "fn counter()\n"
                             "  c = {n = 0}\n"
                             "  fn step() c.n += 1 return {c.n, {c.n}} end\n"
                             "  return step\n"
                             "end\n"
                             "s = counter()\n"
                             "s() s()\n"
                             "print get(8)\n"
                             "print s()\n"
                             "print {get(3), [get(4)] = {get(5)}}\n");
    ASSERT_TRUE(result.ok()) << (result.error ? result.error->message : "");
    EXPECT_EQ(out.str(), "21\n{3, {3}}\n{2, [3] = {5}}\n");
}

TEST(FountainGc, ResultValuesSurviveCollectionUntilNextRun)
{
    std::ostringstream out;
    RunConfig config = quietConfig(out);
    config.interpreter.gcThreshold = 0;
    Runner runner(config);

    auto value = runner.run("{1, 2, 3}");
    ASSERT_TRUE(value.ok());
    ASSERT_TRUE(value.lastValue.isTable());
    runner.collectGarbage();
    EXPECT_EQ(value.lastValue.asTable()->size(), 3u);

    auto failed = runner.run("assert false, {7}");
    ASSERT_EQ(failed.status, fountain::RunResult::Status::RuntimeError);
    ASSERT_TRUE(failed.error);
    ASSERT_TRUE(failed.error->payload.isTable());
    EXPECT_EQ(runner.collectGarbage(), 0u);
    const auto *payload = failed.error->payload.asTable();
    EXPECT_EQ(payload->size(), 1u);
    EXPECT_EQ(payload->get(fountain::interp::Value::number(0)), fountain::interp::Value::number(7));
}

TEST(FountainGc, ValuesBoundToGlobalsOutliveLaterRuns)
{
    std::ostringstream out;
    RunConfig config = quietConfig(out);
    config.interpreter.gcThreshold = 0;
    Runner runner(config);

    auto kept = runner.run("keep = {1, {2}}\nkeep");
    ASSERT_TRUE(kept.ok());
    ASSERT_TRUE(runner.run("x = {9}\nx = nil").ok());
    runner.collectGarbage();
    ASSERT_TRUE(kept.lastValue.isTable());
    EXPECT_EQ(kept.lastValue.asTable()->size(), 2u);
    EXPECT_EQ(fountain::interp::toReprString(kept.lastValue), "{1, {2}}");
}
