//
// Created by gregorian-rayne on 10/13/26.
//

#include "sts/python/lexer.hpp"

#include <gtest/gtest.h>

namespace sts::python
{
    namespace {
        std::vector<TokenType> types_of(const std::vector<Token>& tokens) {
            std::vector<TokenType> types;
            types.reserve(tokens.size());
            for (const auto& t : tokens) {
                types.push_back(t.type);
            }
            return types;
        }

        std::string error_message(std::string_view source) {
            auto result = tokenize(source);
            return result.is_err() ? result.error().message() : "";
        }
    }

    // =============================================================================
    // Token Stream Tests
    // =============================================================================

    TEST(LexerTest, SimpleAssignment) {
        auto result = tokenize("x = 1\n");
        ASSERT_TRUE(result.is_ok());

        const auto& tokens = result.value().tokens;
        const std::vector<TokenType> expected = {
            TokenType::Name, TokenType::Op, TokenType::Number, TokenType::Newline, TokenType::EndMarker
        };
        EXPECT_EQ(types_of(tokens), expected);
        EXPECT_EQ(tokens[0].text, "x");
        EXPECT_EQ(tokens[0].line, 1u);
        EXPECT_EQ(tokens[2].column, 4u);
    }

    TEST(LexerTest, IndentAndDedent) {
        auto result = tokenize("if x:\n    y = 1\nz = 2\n");
        ASSERT_TRUE(result.is_ok());

        const std::vector<TokenType> expected = {
            TokenType::Name, TokenType::Name, TokenType::Op, TokenType::Newline,
            TokenType::Indent, TokenType::Name, TokenType::Op, TokenType::Number, TokenType::Newline,
            TokenType::Dedent, TokenType::Name, TokenType::Op, TokenType::Number, TokenType::Newline,
            TokenType::EndMarker
        };
        EXPECT_EQ(types_of(result.value().tokens), expected);
    }

    TEST(LexerTest, DedentsClosedAtEndOfInput) {
        auto result = tokenize("def f():\n    if x:\n        return 1");
        ASSERT_TRUE(result.is_ok());

        const auto& tokens = result.value().tokens;
        ASSERT_GE(tokens.size(), 4u);
        EXPECT_EQ(tokens[tokens.size() - 1].type, TokenType::EndMarker);
        EXPECT_EQ(tokens[tokens.size() - 2].type, TokenType::Dedent);
        EXPECT_EQ(tokens[tokens.size() - 3].type, TokenType::Dedent);
        EXPECT_EQ(tokens[tokens.size() - 4].type, TokenType::Newline);
    }

    TEST(LexerTest, BracketsJoinLines) {
        auto result = tokenize("total = (1 +\n         2)\n");
        ASSERT_TRUE(result.is_ok());

        std::size_t newlines = 0;
        for (const auto& t : result.value().tokens) {
            if (t.type == TokenType::Newline) ++newlines;
            EXPECT_NE(t.type, TokenType::Indent);
        }
        EXPECT_EQ(newlines, 1u);
    }

    TEST(LexerTest, BackslashJoinsLines) {
        auto result = tokenize("total = 1 + \\\n    2\n");
        ASSERT_TRUE(result.is_ok());

        std::size_t newlines = 0;
        for (const auto& t : result.value().tokens) {
            if (t.type == TokenType::Newline) ++newlines;
        }
        EXPECT_EQ(newlines, 1u);
    }

    TEST(LexerTest, CommentsAndBlankLinesDoNotIndent) {
        auto result = tokenize("def f():\n\n        # note\n    return 1\n");
        ASSERT_TRUE(result.is_ok());

        std::size_t indents = 0;
        for (const auto& t : result.value().tokens) {
            if (t.type == TokenType::Indent) ++indents;
        }
        EXPECT_EQ(indents, 1u);
    }

    TEST(LexerTest, StringLiterals) {
        auto result = tokenize("a = f\"{x}\" + rb'raw' + '''multi\nline'''\n");
        ASSERT_TRUE(result.is_ok());

        std::vector<std::string> strings;
        for (const auto& t : result.value().tokens) {
            if (t.type == TokenType::String) strings.push_back(t.text);
        }
        ASSERT_EQ(strings.size(), 3u);
        EXPECT_EQ(strings[0], "f\"{x}\"");
        EXPECT_EQ(strings[1], "rb'raw'");
        EXPECT_EQ(strings[2], "'''multi\nline'''");
    }

    TEST(LexerTest, MultiCharOperators) {
        auto result = tokenize("x **= y // z\nif (n := 3) != 4: pass\n");
        ASSERT_TRUE(result.is_ok());

        std::vector<std::string> ops;
        for (const auto& t : result.value().tokens) {
            if (t.type == TokenType::Op) ops.push_back(t.text);
        }
        const std::vector<std::string> expected = {"**=", "//", "(", ":=", ")", "!=", ":"};
        EXPECT_EQ(ops, expected);
    }

    TEST(LexerTest, CrLfLineEndings) {
        auto result = tokenize("x = 1\r\ny = 2\r\n");
        ASSERT_TRUE(result.is_ok());

        const auto& tokens = result.value().tokens;
        EXPECT_EQ(tokens[4].text, "y");
        EXPECT_EQ(tokens[4].line, 2u);
        EXPECT_EQ(result.value().raw.loc, 2u);
    }

    TEST(LexerTest, Keywords) {
        EXPECT_TRUE(is_keyword("if"));
        EXPECT_TRUE(is_keyword("lambda"));
        EXPECT_FALSE(is_keyword("match"));
        EXPECT_FALSE(is_keyword("print"));
    }

    // =============================================================================
    // Error Tests
    // =============================================================================

    TEST(LexerErrorTest, UnterminatedString) {
        auto result = tokenize("x = 1\ny = 'abc\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().message(), "unterminated string literal");
        EXPECT_EQ(result.error().context().value(), "line 2");
    }

    TEST(LexerErrorTest, UnterminatedTripleQuotedString) {
        EXPECT_EQ(error_message("doc = \"\"\"never\nends\n"), "unterminated triple-quoted string literal");
    }

    TEST(LexerErrorTest, UnclosedBracket) {
        auto result = tokenize("items = [1,\n  2,\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "'[' was never closed");
        EXPECT_EQ(result.error().context().value(), "line 1");
    }

    TEST(LexerErrorTest, UnmatchedAndMismatchedBrackets) {
        EXPECT_EQ(error_message("x = 1)\n"), "unmatched ')'");
        EXPECT_EQ(error_message("x = [1)\n"),
                  "closing parenthesis ')' does not match opening parenthesis '['");
    }

    TEST(LexerErrorTest, InvalidCharacters) {
        EXPECT_EQ(error_message("cost = $5\n"), "invalid character '$'");
        EXPECT_EQ(error_message("ok = x ? y\n"), "invalid character '?'");
        EXPECT_EQ(error_message("x = !y\n"), "invalid syntax '!'");
    }

    TEST(LexerErrorTest, InconsistentDedent) {
        auto result = tokenize("if x:\n        a = 1\n    b = 2\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().message(), "unindent does not match any outer indentation level");
        EXPECT_EQ(result.error().context().value(), "line 3");
    }

    TEST(LexerErrorTest, DanglingContinuation) {
        EXPECT_EQ(error_message("x = 1 + \\"), "unexpected EOF after line continuation character");
        EXPECT_EQ(error_message("x = 1 \\ + 2\n"), "unexpected character after line continuation character");
    }

    // =============================================================================
    // Raw Metrics Tests
    // =============================================================================

    TEST(RawMetricsTest, CountsLineCategories) {
        const std::string source =
            "\"\"\"Module doc.\"\"\"\n"
            "\n"
            "# comment\n"
            "x = 1  # trailing\n"
            "\n"
            "def f():\n"
            "    return x\n";

        auto result = tokenize(source);
        ASSERT_TRUE(result.is_ok());

        const auto& raw = result.value().raw;
        EXPECT_EQ(raw.loc, 7u);
        EXPECT_EQ(raw.sloc, 3u);
        EXPECT_EQ(raw.comments, 2u);
        EXPECT_EQ(raw.multi, 1u);
        EXPECT_EQ(raw.blank, 2u);
        EXPECT_EQ(raw.lloc, 4u);
    }

    TEST(RawMetricsTest, SemicolonsSplitLogicalLines) {
        auto result = tokenize("a = 1; b = 2; c = 3\n");
        ASSERT_TRUE(result.is_ok());

        EXPECT_EQ(result.value().raw.lloc, 3u);
        EXPECT_EQ(result.value().raw.sloc, 1u);
    }

    TEST(RawMetricsTest, MultiLineDocstring) {
        const std::string source =
            "def f():\n"
            "    \"\"\"First line.\n"
            "\n"
            "    More.\n"
            "    \"\"\"\n"
            "    return 1\n";

        auto result = tokenize(source);
        ASSERT_TRUE(result.is_ok());

        const auto& raw = result.value().raw;
        EXPECT_EQ(raw.loc, 6u);
        EXPECT_EQ(raw.multi, 4u);
        EXPECT_EQ(raw.sloc, 2u);
        EXPECT_EQ(raw.blank, 0u);
    }

    TEST(RawMetricsTest, EmptySource) {
        auto result = tokenize("");
        ASSERT_TRUE(result.is_ok());

        EXPECT_EQ(result.value().tokens.size(), 1u);
        EXPECT_EQ(result.value().raw.loc, 0u);
        EXPECT_EQ(result.value().raw.lloc, 0u);
    }

}  // namespace sts::python
