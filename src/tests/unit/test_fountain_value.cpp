//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Unit tests for values and tables: equality, hashing of signed zero, number
// formatting, table ordering and key validation, and the printable forms.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fountain/Runner.hpp"
#include "interp/Function.hpp"
#include "interp/Heap.hpp"
#include "interp/Table.hpp"
#include "interp/Value.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace fountain::interp;

TEST(FountainValue, KindNames)
{
    EXPECT_EQ(valueKindName(Value().kind()), "nil");
    EXPECT_EQ(valueKindName(Value::boolean(true).kind()), "bool");
    EXPECT_EQ(valueKindName(Value::number(1).kind()), "number");
    EXPECT_EQ(valueKindName(Value::string("s").kind()), "string");
}

TEST(FountainValue, Truthiness)
{
    EXPECT_FALSE(Value::nil().truthy());
    EXPECT_FALSE(Value::boolean(false).truthy());
    EXPECT_TRUE(Value::boolean(true).truthy());
    EXPECT_TRUE(Value::number(0).truthy());
    EXPECT_TRUE(Value::string("").truthy());
}

TEST(FountainValue, EqualityNeverCoerces)
{
    EXPECT_NE(Value::number(123), Value::string("123"));
    EXPECT_NE(Value::boolean(false), Value::nil());
    EXPECT_NE(Value::number(0), Value::boolean(false));
    EXPECT_EQ(Value::string("cat"), Value::string("cat"));
    EXPECT_EQ(Value::number(-0.0), Value::number(0.0));
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_NE(Value::number(nan), Value::number(nan));
}

TEST(FountainValue, TablesCompareByIdentity)
{
    Heap heap;
    Table *a = heap.make<Table>();
    Table *b = heap.make<Table>();
    EXPECT_EQ(Value::table(a), Value::table(a));
    EXPECT_NE(Value::table(a), Value::table(b));
    EXPECT_TRUE(deepEquals(Value::table(a), Value::table(b)));
}

TEST(FountainValue, FormatNumber)
{
    EXPECT_EQ(formatNumber(3), "3");
    EXPECT_EQ(formatNumber(100), "100");
    EXPECT_EQ(formatNumber(0.5), "0.5");
    EXPECT_EQ(formatNumber(2.5), "2.5");
    EXPECT_EQ(formatNumber(-7), "-7");
    EXPECT_EQ(formatNumber(1e100), "1e+100");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(formatNumber(-std::numeric_limits<double>::infinity()), "-inf");
    EXPECT_EQ(formatNumber(std::numeric_limits<double>::quiet_NaN()), "nan");
}

TEST(FountainTable, PreservesInsertionOrderAcrossOverwrites)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::string("b"), Value::number(1));
    t->set(Value::string("a"), Value::number(2));
    t->set(Value::string("b"), Value::number(3));
    ASSERT_EQ(t->size(), 2u);
    EXPECT_EQ(t->entries()[0].first, Value::string("b"));
    EXPECT_EQ(t->entries()[0].second, Value::number(3));
    EXPECT_EQ(t->entries()[1].first, Value::string("a"));
}

TEST(FountainTable, MissingKeyReadsNil)
{
    Heap heap;
    Table *t = heap.make<Table>();
    EXPECT_TRUE(t->get(Value::number(99)).isNil());
    EXPECT_FALSE(t->contains(Value::number(99)));
}

TEST(FountainTable, NilValueIsStored)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::string("k"), Value::nil());
    EXPECT_TRUE(t->contains(Value::string("k")));
    EXPECT_EQ(t->size(), 1u);
}

TEST(FountainTable, SignedZeroIsOneKey)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::number(-0.0), Value::string("z"));
    EXPECT_EQ(t->get(Value::number(0.0)), Value::string("z"));
    t->set(Value::number(0.0), Value::string("y"));
    EXPECT_EQ(t->size(), 1u);
}

TEST(FountainTable, KeysOfDifferentKindsAreDistinct)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::number(1), Value::string("number"));
    t->set(Value::string("1"), Value::string("string"));
    t->set(Value::boolean(true), Value::string("bool"));
    EXPECT_EQ(t->size(), 3u);
    EXPECT_EQ(t->get(Value::number(1)), Value::string("number"));
}

TEST(FountainTable, ValidateKey)
{
    EXPECT_EQ(Table::validateKey(Value::number(std::nan(""))),
              std::optional<std::string_view>("table index is NaN"));
    EXPECT_FALSE(Table::validateKey(Value::number(1)).has_value());
    EXPECT_FALSE(Table::validateKey(Value::boolean(false)).has_value());
    EXPECT_FALSE(Table::validateKey(Value::nil()).has_value());
}

TEST(FountainValue, DisplayAndReprOfScalars)
{
    EXPECT_EQ(toDisplayString(Value::string("hi")), "hi");
    EXPECT_EQ(toReprString(Value::string("hi")), "\"hi\"");
    EXPECT_EQ(toReprString(Value::string("say \"hi\"")), "'say \"hi\"'");
    EXPECT_EQ(toDisplayString(Value::nil()), "nil");
    EXPECT_EQ(toDisplayString(Value::boolean(true)), "true");
    EXPECT_EQ(toDisplayString(Value::number(1e21)), "1e+21");
    EXPECT_EQ(toReprString(Value::number(1e21)), "1000000000000000000000");
}

TEST(FountainValue, RenderTable)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::number(0), Value::number(1));
    t->set(Value::number(1), Value::string("a"));
    t->set(Value::string("name"), Value::number(0.5));
    t->set(Value::number(5), Value::boolean(true));
    t->set(Value::string("two words"), Value::nil());
    t->set(Value::string("end"), Value::number(2));
    EXPECT_EQ(toDisplayString(Value::table(t)),
              "{1, \"a\", name = 0.5, [5] = true, [\"two words\"] = nil, [\"end\"] = 2}");
}

TEST(FountainValue, RenderNonSequentialNumericKeys)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::number(1), Value::string("a"));
    t->set(Value::number(0), Value::string("b"));
    EXPECT_EQ(toDisplayString(Value::table(t)), "{[1] = \"a\", \"b\"}");
}

TEST(FountainValue, RenderCycle)
{
    Heap heap;
    Table *t = heap.make<Table>();
    t->set(Value::string("self"), Value::table(t));
    EXPECT_EQ(toDisplayString(Value::table(t)), "{self = {...}}");
}

TEST(FountainValue, RenderSharedTableTwice)
{
    Heap heap;
    Table *inner = heap.make<Table>();
    inner->set(Value::number(0), Value::number(7));
    Table *outer = heap.make<Table>();
    outer->set(Value::number(0), Value::table(inner));
    outer->set(Value::number(1), Value::table(inner));
    // Shared, not cyclic: both occurrences render in full.
    EXPECT_EQ(toDisplayString(Value::table(outer)), "{{7}, {7}}");
}

TEST(FountainValue, RenderBuiltin)
{
    Heap heap;
    Builtin *fn = heap.make<Builtin>("len", 1, [](const std::vector<Value> &) { return Value(); });
    EXPECT_EQ(toDisplayString(Value::function(fn)), "<builtin len>");
}

TEST(FountainValue, TableReprReadsBackEqual)
{
    std::ostringstream out;
    fountain::RunConfig config;
    config.output = &out;
    config.interpreter.gcThreshold = 0;
    fountain::Runner runner(config);

    auto original = runner.run(
        "a = {1, 'x', k = {2.5, true, nil}, [10] = 'ten', ['a b'] = -3, big = 1e21}\na");
    ASSERT_TRUE(original.ok());
    ASSERT_TRUE(original.lastValue.isTable());
    const std::string repr = toReprString(original.lastValue);

    ASSERT_TRUE(runner.run("b = " + repr).ok()) << repr;
    auto both = runner.run("{a, b}");
    ASSERT_TRUE(both.ok());
    ASSERT_TRUE(both.lastValue.isTable());
    const Value a = both.lastValue.asTable()->get(Value::number(0));
    const Value b = both.lastValue.asTable()->get(Value::number(1));
    EXPECT_NE(a, b);
    EXPECT_TRUE(deepEquals(a, b)) << repr;
}

TEST(FountainValue, NonFiniteNumbersReadBackInsideTables)
{
    std::ostringstream out;
    fountain::RunConfig config;
    config.output = &out;
    fountain::Runner runner(config);

    auto original = runner.run("t = {1 / 0, -1 / 0, 0 / 0, [1 / 0] = 'up'}\nt");
    ASSERT_TRUE(original.ok());
    const std::string repr = toReprString(original.lastValue);
    EXPECT_EQ(repr, "{(1/0), (-1/0), (0/0), [(1/0)] = \"up\"}");

    auto copy = runner.run("u = " + repr + "\n"
                           "print u[0] == t[0] and u[1] == t[1]\n"
                           "print u[2] != u[2]\n"
                           "print u[1 / 0]\n"
                           "print u\n");
    ASSERT_TRUE(copy.ok()) << repr;
    EXPECT_EQ(out.str(), "true\ntrue\nup\n{(1/0), (-1/0), (0/0), [(1/0)] = \"up\"}\n");
}

TEST(FountainValue, DeepEqualsDetectsDifferences)
{
    Heap heap;
    Table *a = heap.make<Table>();
    Table *b = heap.make<Table>();
    a->set(Value::number(0), Value::number(1));
    b->set(Value::number(0), Value::number(2));
    EXPECT_FALSE(deepEquals(Value::table(a), Value::table(b)));

    // Same entries in a different order are different tables.
    Table *c = heap.make<Table>();
    Table *d = heap.make<Table>();
    c->set(Value::string("x"), Value::number(1));
    c->set(Value::string("y"), Value::number(2));
    d->set(Value::string("y"), Value::number(2));
    d->set(Value::string("x"), Value::number(1));
    EXPECT_FALSE(deepEquals(Value::table(c), Value::table(d)));
}
