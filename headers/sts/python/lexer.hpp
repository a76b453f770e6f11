//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef STS_PYTHON_LEXER_HPP
#define STS_PYTHON_LEXER_HPP

/**
 * @file lexer.hpp
 * @brief Tokenizer for Python 3 source text.
 *
 * Produces the token stream the structural parser and the Halstead counter
 * work on. Indentation is turned into INDENT/DEDENT tokens, lines joined by
 * brackets or backslashes produce a single NEWLINE, and comments are
 * dropped (but counted).
 *
 * The lexer rejects text that CPython's tokenizer would reject:
 * unterminated strings, unbalanced or mismatched brackets, inconsistent
 * dedents, stray characters such as '$' or '?'. f-strings are scanned as
 * opaque string literals.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sts::python {

    enum class TokenType {
        Name,
        Number,
        String,
        Op,
        Newline,
        Indent,
        Dedent,
        EndMarker
    };

    const char* to_string(TokenType type) noexcept;

    struct Token {
        TokenType type = TokenType::EndMarker;
        std::string text;
        std::size_t line = 0;       // 1-based
        std::size_t column = 0;     // 0-based

        [[nodiscard]] bool is(const TokenType t, const std::string_view s) const noexcept {
            return type == t && text == s;
        }

        [[nodiscard]] bool is_op(const std::string_view s) const noexcept {
            return is(TokenType::Op, s);
        }

        [[nodiscard]] bool is_name(const std::string_view s) const noexcept {
            return is(TokenType::Name, s);
        }
    };

    /**
     * Line counts gathered while tokenizing.
     *
     * - loc: physical lines
     * - blank: whitespace-only lines outside strings
     * - comments: lines carrying a comment
     * - multi: lines of standalone multi-line strings (docstrings)
     * - sloc: loc minus blank, comment-only and docstring lines
     * - lloc: logical lines (statements)
     */
    struct RawMetrics {
        std::size_t loc = 0;
        std::size_t lloc = 0;
        std::size_t sloc = 0;
        std::size_t comments = 0;
        std::size_t multi = 0;
        std::size_t blank = 0;
    };

    struct LexResult {
        std::vector<Token> tokens;
        RawMetrics raw;
    };

    /**
     * Tokenizes a Python module.
     *
     * @param source Module text (UTF-8).
     * @return Tokens ending in EndMarker, or a ParseError whose context is
     *         "line N".
     */
    Result<LexResult, Error> tokenize(std::string_view source);

    /**
     * Checks whether a Name token is a hard keyword.
     */
    bool is_keyword(std::string_view name) noexcept;

}  // namespace sts::python

#endif //STS_PYTHON_LEXER_HPP
