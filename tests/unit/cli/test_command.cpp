//
// Created by gregorian-rayne on 10/16/26.
//

#include "sts/cli/commands/command.hpp"

#include <gtest/gtest.h>

namespace sts::cli
{
    namespace {
        std::vector<ArgDef> audit_like_args() {
            return {
                {"output", 'o', "Write the JSON report to FILE", false, true, "", "FILE"},
                {"config", 'c', "Policy file", false, true, "", "FILE"},
                {"jobs", 'j', "Worker threads", false, true, "0", "N"},
                {"no-churn", 0, "Skip git history", false, false, "", ""},
            };
        }
    }

    TEST(ParseArgumentsTest, PositionalsAndDefaults) {
        const auto result = parse_arguments({"src"}, audit_like_args());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.positional(), std::vector<std::string>{"src"});
        EXPECT_EQ(result.args.get_or("jobs", ""), "0");
        EXPECT_EQ(result.args.get_int("jobs"), 0);
        EXPECT_FALSE(result.args.get("output").has_value());
        EXPECT_FALSE(result.args.get_flag("no-churn"));
    }

    TEST(ParseArgumentsTest, LongOptions) {
        const auto result = parse_arguments(
            {"--output", "report.json", "--config=strict.toml", "--no-churn", "src"},
            audit_like_args());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("output"), "report.json");
        EXPECT_EQ(result.args.get("config"), "strict.toml");
        EXPECT_TRUE(result.args.get_flag("no-churn"));
        EXPECT_EQ(result.args.positional(), std::vector<std::string>{"src"});
    }

    TEST(ParseArgumentsTest, ShortOptions) {
        const auto result = parse_arguments({"-o", "out.json", "-j4", "-q", "app.py"}, audit_like_args());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("output"), "out.json");
        EXPECT_EQ(result.args.get_int("jobs"), 4);
        EXPECT_TRUE(result.args.get_flag("quiet"));
    }

    TEST(ParseArgumentsTest, VerbosityLevels) {
        const auto verbose = parse_arguments({"-v"}, audit_like_args());
        EXPECT_TRUE(verbose.args.get_flag("verbose"));
        EXPECT_FALSE(verbose.args.get_flag("debug"));

        const auto debug = parse_arguments({"-vv"}, audit_like_args());
        EXPECT_TRUE(debug.args.get_flag("debug"));

        const auto spelled = parse_arguments({"--verbose", "--verbose"}, audit_like_args());
        EXPECT_TRUE(spelled.args.get_flag("debug"));
    }

    TEST(ParseArgumentsTest, CommonFlags) {
        const auto result = parse_arguments({"--json", "--no-color", "--help"}, audit_like_args());

        ASSERT_TRUE(result.success);
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("no-color"));
        EXPECT_TRUE(result.args.get_flag("help"));
    }

    TEST(ParseArgumentsTest, DoubleDashEndsOptions) {
        const auto result = parse_arguments({"--", "-weird-name.py"}, audit_like_args());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.positional(), std::vector<std::string>{"-weird-name.py"});
    }

    TEST(ParseArgumentsTest, Errors) {
        const auto unknown = parse_arguments({"--format", "html"}, audit_like_args());
        EXPECT_FALSE(unknown.success);
        EXPECT_EQ(unknown.error, "Unknown option: --format");

        const auto unknown_short = parse_arguments({"-x"}, audit_like_args());
        EXPECT_FALSE(unknown_short.success);
        EXPECT_EQ(unknown_short.error, "Unknown option: -x");

        const auto missing = parse_arguments({"--output"}, audit_like_args());
        EXPECT_FALSE(missing.success);
        EXPECT_EQ(missing.error, "Option --output requires a value");

        const auto valued_flag = parse_arguments({"--no-churn=yes"}, audit_like_args());
        EXPECT_FALSE(valued_flag.success);
        EXPECT_EQ(valued_flag.error, "Option --no-churn does not take a value");
    }

    TEST(ParsedArgsTest, GetIntRejectsGarbage) {
        ParsedArgs args;
        args.set("jobs", "4x");
        EXPECT_FALSE(args.get_int("jobs").has_value());

        args.set("jobs", "-2");
        EXPECT_EQ(args.get_int("jobs"), -2);

        EXPECT_FALSE(args.get_int("missing").has_value());
    }

}  // namespace sts::cli
