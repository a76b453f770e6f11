//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef STS_PYTHON_MODULE_PARSER_HPP
#define STS_PYTHON_MODULE_PARSER_HPP

/**
 * @file module_parser.hpp
 * @brief Statement-level structure of a Python module.
 *
 * The parser groups the token stream into logical statements, tracks the
 * block structure built from INDENT/DEDENT tokens and assigns every
 * statement to the function scope that owns it. It validates what a
 * block-level reading can validate:
 *
 * - an indented block must follow a header ending in ':'
 * - compound headers must contain their ':'
 * - elif/else/except/finally must continue a matching clause chain
 * - a try must be followed by except or finally
 * - if/elif/while/for/with headers need an expression, for needs 'in',
 *   else/try/finally take nothing before ':'
 * - no two operands in a row (`print "x"`, `a b`), no statement keyword
 *   in the middle of a statement, no `= =`
 *
 * Expressions are not parsed; analyzers scan statement token ranges.
 */

#include "sts/python/lexer.hpp"
#include "sts/result.hpp"
#include "sts/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sts::python {

    /**
     * What kind of clause a statement header opens.
     */
    enum class ClauseKind {
        Simple,
        If,
        Elif,
        Else,           // else of an if chain
        LoopElse,       // else of a for/while loop
        TryElse,        // else of a try statement
        For,
        While,
        Try,
        Except,
        Finally,
        With,
        Def,
        Class,
        Match,
        Case
    };

    const char* to_string(ClauseKind kind) noexcept;

    enum class ScopeKind {
        Module,
        Function
    };

    /**
     * A unit of code that owns statements: the module or one def.
     *
     * Class bodies do not form a scope; their statements belong to the
     * enclosing scope while their methods are qualified by the class name.
     */
    struct Scope {
        ScopeKind kind = ScopeKind::Module;
        std::string name;                // "<module>", "Cart.total", "outer.inner"
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        std::size_t parent = 0;          // index of the enclosing scope
    };

    /**
     * One logical statement, or the header part of a compound statement.
     *
     * [begin, end) indexes into ModuleStructure::tokens. For a compound
     * header the range stops before the header ':'. A one-line body such as
     * `if x: return y` produces a separate Simple statement for `return y`.
     */
    struct Statement {
        ClauseKind kind = ClauseKind::Simple;
        std::size_t scope = 0;
        std::size_t begin = 0;
        std::size_t end = 0;
        std::size_t line = 0;
        bool is_async = false;           // async def/for/with
        bool irrefutable = false;        // case _: or a bare capture
    };

    struct ModuleStructure {
        std::vector<Token> tokens;
        RawMetrics raw;
        std::vector<Scope> scopes;       // scopes[0] is the module
        std::vector<Statement> statements;
    };

    /**
     * Tokenizes and structures a module.
     *
     * @param source Module text.
     * @return The structure, or a ParseError with a "line N" context.
     */
    Result<ModuleStructure, Error> parse_module(std::string_view source);

}  // namespace sts::python

#endif //STS_PYTHON_MODULE_PARSER_HPP
