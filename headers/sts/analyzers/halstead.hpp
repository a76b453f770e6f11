//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef STS_HALSTEAD_HPP
#define STS_HALSTEAD_HPP

/**
 * @file halstead.hpp
 * @brief Halstead measures and Maintainability Index.
 *
 * Both are advisory: they are reported but never affect a verdict.
 *
 * Operators are operator tokens other than brackets and separators, and
 * keywords other than True/False/None. Operands are names, numbers,
 * strings and the three constants.
 */

#include "sts/analyzers/analyzer.hpp"
#include "sts/python/lexer.hpp"

#include <cstddef>
#include <vector>

namespace sts::analyzers {

    HalsteadMetrics compute_halstead(const std::vector<python::Token>& tokens);

    /**
     * Maintainability Index on a 0..100 scale.
     *
     * MI = max(0, (171 - 5.2 ln V - 0.23 G - 16.2 ln L
     *              + 50 sin(sqrt(2.46 * radians(C)))) * 100 / 171)
     *
     * @param volume Halstead volume V.
     * @param total_cc Summed cyclomatic complexity G.
     * @param logical_lines Logical lines L.
     * @param comment_percent Comment lines as a percentage of source lines C.
     * @return 100 when V or L is zero.
     */
    double maintainability_index(double volume, int total_cc,
                                 std::size_t logical_lines, double comment_percent);

}  // namespace sts::analyzers

#endif //STS_HALSTEAD_HPP
