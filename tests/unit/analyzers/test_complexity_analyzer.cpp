//
// Created by gregorian-rayne on 10/14/26.
//

#include "sts/analyzers/complexity_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace sts::analyzers
{
    namespace {
        ComplexityResult analyze(const std::string& source) {
            auto result = analyze_complexity(source);
            EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().to_string() : "");
            return result.is_ok() ? result.value() : ComplexityResult{};
        }

        const SourceUnit* find_unit(const ComplexityResult& result, const std::string& name) {
            const auto it = std::ranges::find(result.units, name, &SourceUnit::name);
            return it == result.units.end() ? nullptr : &*it;
        }

        int complexity_of(const ComplexityResult& result, const std::string& name) {
            const auto* unit = find_unit(result, name);
            EXPECT_NE(unit, nullptr) << "no unit named " << name;
            return unit ? unit->complexity : -1;
        }
    }

    // =============================================================================
    // Decision Rule Tests
    // =============================================================================

    TEST(ComplexityAnalyzerTest, StraightLineFunction) {
        const auto result = analyze("def f(x):\n    return x\n");

        ASSERT_EQ(result.units.size(), 1u);
        EXPECT_EQ(result.units[0].name, "f");
        EXPECT_EQ(result.units[0].complexity, 1);
        EXPECT_EQ(result.max_cc, 1);
        EXPECT_DOUBLE_EQ(result.mean_cc, 1.0);
    }

    TEST(ComplexityAnalyzerTest, CountsEveryDecisionKind) {
        const auto result = analyze(
            "def classify(n):\n"
            "    if n < 0 and n != -1:\n"        // if, and
            "        return 'neg'\n"
            "    elif n == 0:\n"                  // elif
            "        return 'zero'\n"
            "    else:\n"
            "        pass\n"
            "    for i in range(n):\n"            // for
            "        pass\n"
            "    else:\n"                         // loop else
            "        pass\n"
            "    while n > 10 or n < -10:\n"      // while, or
            "        n //= 2\n"
            "    try:\n"
            "        pass\n"
            "    except ValueError:\n"            // except
            "        pass\n"
            "    else:\n"                         // try else
            "        pass\n"
            "    return [x for x in range(n) if x % 2]\n");   // comprehension for, if

        EXPECT_EQ(complexity_of(result, "classify"), 12);
    }

    TEST(ComplexityAnalyzerTest, ConditionalExpression) {
        const auto result = analyze("def pick(a):\n    return 1 if a else 2\n");
        EXPECT_EQ(complexity_of(result, "pick"), 2);
    }

    TEST(ComplexityAnalyzerTest, MatchCases) {
        const auto result = analyze(
            "def route(cmd):\n"
            "    match cmd:\n"
            "        case 'a':\n"
            "            return 1\n"
            "        case 'b' | 'c':\n"
            "            return 2\n"
            "        case _:\n"
            "            return 0\n");

        EXPECT_EQ(complexity_of(result, "route"), 3);
    }

    TEST(ComplexityAnalyzerTest, WithAndFinallyAddNothing) {
        const auto result = analyze(
            "def io(path):\n"
            "    with open(path) as fh:\n"
            "        try:\n"
            "            return fh.read()\n"
            "        finally:\n"
            "            pass\n");

        EXPECT_EQ(complexity_of(result, "io"), 1);
    }

    TEST(ComplexityAnalyzerTest, AsyncForCountsOnce) {
        const auto result = analyze(
            "async def drain(q):\n"
            "    async for item in q:\n"
            "        pass\n");

        EXPECT_EQ(complexity_of(result, "drain"), 2);
    }

    // =============================================================================
    // Unit Attribution Tests
    // =============================================================================

    TEST(ComplexityAnalyzerTest, NestedFunctionsAreSeparateUnits) {
        const auto result = analyze(
            "def outer(a):\n"
            "    if a:\n"
            "        pass\n"
            "    def inner(b):\n"
            "        if b:\n"
            "            pass\n"
            "        if not b:\n"
            "            pass\n"
            "    return inner\n");

        ASSERT_EQ(result.units.size(), 2u);
        EXPECT_EQ(complexity_of(result, "outer"), 2);
        EXPECT_EQ(complexity_of(result, "outer.inner"), 3);
        EXPECT_EQ(result.max_cc, 3);
        EXPECT_DOUBLE_EQ(result.mean_cc, 2.5);
    }

    TEST(ComplexityAnalyzerTest, MethodsQualifiedByClass) {
        const auto result = analyze(
            "class Cart:\n"
            "    def total(self):\n"
            "        return sum(i.price for i in self.items)\n");

        ASSERT_EQ(result.units.size(), 1u);
        EXPECT_EQ(result.units[0].name, "Cart.total");
        EXPECT_EQ(result.units[0].complexity, 2);
        EXPECT_EQ(result.units[0].start_line, 2u);
        EXPECT_EQ(result.units[0].end_line, 3u);
    }

    TEST(ComplexityAnalyzerTest, ModuleUnitOnlyWithDecisions) {
        const auto quiet = analyze("import os\nVALUE = 1\n");
        EXPECT_TRUE(quiet.units.empty());
        EXPECT_EQ(quiet.max_cc, 0);

        const auto busy = analyze(
            "import sys\n"
            "class Settings:\n"
            "    if sys.platform == 'win32':\n"
            "        sep = '\\\\'\n"
            "if __name__ == '__main__':\n"
            "    pass\n");
        EXPECT_EQ(complexity_of(busy, "<module>"), 3);
    }

    TEST(ComplexityAnalyzerTest, DefaultArgumentsBelongToEnclosingScope) {
        const auto result = analyze("def f(a=1 if X else 2):\n    return a\n");

        EXPECT_EQ(complexity_of(result, "f"), 1);
        EXPECT_EQ(complexity_of(result, "<module>"), 2);
    }

    TEST(ComplexityAnalyzerTest, ComplexitySpike) {
        std::string source = "def spike(x):\n";
        for (int i = 0; i < 25; ++i) {
            source += "    if x == " + std::to_string(i) + ":\n";
            source += "        return " + std::to_string(i) + "\n";
        }
        source += "    return -1\n";
        source += "\n\ndef calm():\n    return 0\n";

        const auto result = analyze(source);

        EXPECT_EQ(complexity_of(result, "spike"), 26);
        EXPECT_EQ(complexity_of(result, "calm"), 1);
        EXPECT_EQ(result.max_cc, 26);
    }

    // =============================================================================
    // Advisory Metric Tests
    // =============================================================================

    TEST(ComplexityAnalyzerTest, EmptyModule) {
        const auto result = analyze("");

        EXPECT_TRUE(result.units.empty());
        EXPECT_EQ(result.max_cc, 0);
        EXPECT_DOUBLE_EQ(result.mean_cc, 0.0);
        EXPECT_DOUBLE_EQ(result.maintainability_index, 100.0);
    }

    TEST(ComplexityAnalyzerTest, AdvisoryMetricsPopulated) {
        const auto result = analyze(
            "def area(w, h):\n"
            "    if w < 0 or h < 0:\n"
            "        raise ValueError('negative')\n"
            "    return w * h\n");

        EXPECT_GT(result.halstead.volume, 0.0);
        EXPECT_GT(result.halstead.effort, 0.0);
        EXPECT_GT(result.maintainability_index, 0.0);
        EXPECT_LE(result.maintainability_index, 100.0);
        EXPECT_EQ(result.total_cc, 1 + 3);   // module scope plus area
    }

    TEST(ComplexityAnalyzerTest, ParseErrorPropagates) {
        auto result = analyze_complexity("def broken(:\n    pass\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(ComplexityAnalyzerTest, InvalidStatementsAreNotScored) {
        for (const auto source : {"print \"hello\"\n", "x = = 1\n", "def f():\n    return return\n"}) {
            auto result = analyze_complexity(std::string_view(source));
            EXPECT_TRUE(result.is_err()) << source;
        }
    }

    TEST(ComplexityAnalyzerTest, Deterministic) {
        const std::string source = "def f(a, b):\n    return a and b or not a\n";

        const auto first = analyze(source);
        const auto second = analyze(source);

        EXPECT_EQ(first.max_cc, second.max_cc);
        EXPECT_DOUBLE_EQ(first.halstead.effort, second.halstead.effort);
        EXPECT_DOUBLE_EQ(first.maintainability_index, second.maintainability_index);
    }

}  // namespace sts::analyzers
