//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef STS_ANALYZER_HPP
#define STS_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Result types of the per-file analyzers.
 *
 * Analyzer types:
 * - Complexity: cyclomatic complexity per unit, Halstead and MI (advisory)
 * - Drift: density of lines matching the illegal-pattern set
 * - Lag: presence of deprecated-API patterns
 * - Churn: normalized recent change frequency from version control
 *
 * Analyzers are independent: none of them reads another analyzer's output.
 */

#include "sts/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sts::analyzers {

    /**
     * Token-based Halstead measures for a whole file.
     */
    struct HalsteadMetrics {
        std::size_t distinct_operators = 0;     // n1
        std::size_t distinct_operands = 0;      // n2
        std::size_t total_operators = 0;        // N1
        std::size_t total_operands = 0;         // N2

        double volume = 0.0;
        double difficulty = 0.0;
        double effort = 0.0;

        [[nodiscard]] std::size_t vocabulary() const noexcept {
            return distinct_operators + distinct_operands;
        }

        [[nodiscard]] std::size_t length() const noexcept {
            return total_operators + total_operands;
        }
    };

    struct ComplexityResult {
        std::vector<SourceUnit> units;
        int max_cc = 0;
        double mean_cc = 0.0;
        int total_cc = 0;                       // sum over all scopes, feeds MI

        HalsteadMetrics halstead;
        double maintainability_index = 100.0;
    };

    struct DriftResult {
        double adf = 0.0;
        std::size_t matching_lines = 0;
        std::size_t counted_lines = 0;          // non-blank lines
        std::vector<std::size_t> line_numbers;  // 1-based
    };

    struct LagResult {
        TechnicalLag lag = TechnicalLag::Low;
        std::vector<std::size_t> line_numbers;
    };

    struct ChurnResult {
        std::optional<double> ccr;              // empty when history is unavailable
        std::optional<std::size_t> touches;
        std::string note;                       // why ccr is unknown
    };

}  // namespace sts::analyzers

#endif //STS_ANALYZER_HPP
