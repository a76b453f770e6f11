//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef STS_COMPLEXITY_ANALYZER_HPP
#define STS_COMPLEXITY_ANALYZER_HPP

/**
 * @file complexity_analyzer.hpp
 * @brief Cyclomatic complexity per function, plus advisory metrics.
 *
 * A unit's complexity is 1 plus its decision points:
 *
 * | Construct                              | Points |
 * |----------------------------------------|--------|
 * | if, elif, `a if c else b`              | 1 each |
 * | for, async for, while                  | 1      |
 * | else of a loop                         | 1      |
 * | comprehension for / comprehension if   | 1 each |
 * | except handler, else of a try          | 1 each |
 * | and, or                                | 1 each |
 * | case arm (not `case _:` or a capture)  | 1      |
 *
 * Decisions inside a nested def belong to that def. Module-level code,
 * class bodies included, forms the `<module>` unit, which is only reported
 * when it has at least one decision.
 */

#include "sts/analyzers/analyzer.hpp"
#include "sts/python/module_parser.hpp"
#include "sts/result.hpp"
#include "sts/error.hpp"

#include <string_view>

namespace sts::analyzers {

    /**
     * Number of decision points contributed by one statement.
     */
    int decision_points(const python::ModuleStructure& module, const python::Statement& statement);

    /**
     * Computes per-unit complexity from an already parsed module.
     */
    ComplexityResult analyze_complexity(const python::ModuleStructure& module);

    /**
     * Parses source text and computes its complexity report.
     *
     * @return The report, or the ParseError that made the file unparseable.
     */
    Result<ComplexityResult, Error> analyze_complexity(std::string_view source);

}  // namespace sts::analyzers

#endif //STS_COMPLEXITY_ANALYZER_HPP
