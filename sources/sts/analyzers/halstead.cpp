//
// Created by gregorian-rayne on 10/8/26.
//

#include "sts/analyzers/halstead.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <set>
#include <string>
#include <string_view>

namespace sts::analyzers {

    namespace {

        constexpr std::string_view NON_OPERATOR_OPS[] = {
            "(", ")", "[", "]", "{", "}", ",", ":", ";"
        };

        bool is_constant(const std::string_view name) noexcept {
            return name == "True" || name == "False" || name == "None";
        }

    }  // namespace

    HalsteadMetrics compute_halstead(const std::vector<python::Token>& tokens) {
        std::set<std::string> operators;
        std::set<std::string> operands;
        HalsteadMetrics metrics;

        for (const auto& tok : tokens) {
            switch (tok.type) {
                case python::TokenType::Op:
                    if (std::ranges::find(NON_OPERATOR_OPS, tok.text) != std::end(NON_OPERATOR_OPS)) {
                        break;
                    }
                    operators.insert(tok.text);
                    ++metrics.total_operators;
                    break;

                case python::TokenType::Name:
                    if (python::is_keyword(tok.text) && !is_constant(tok.text)) {
                        operators.insert(tok.text);
                        ++metrics.total_operators;
                    } else {
                        operands.insert(tok.text);
                        ++metrics.total_operands;
                    }
                    break;

                case python::TokenType::Number:
                case python::TokenType::String:
                    operands.insert(tok.text);
                    ++metrics.total_operands;
                    break;

                default:
                    break;
            }
        }

        metrics.distinct_operators = operators.size();
        metrics.distinct_operands = operands.size();

        const auto n = static_cast<double>(metrics.vocabulary());
        const auto length = static_cast<double>(metrics.length());
        metrics.volume = n > 0.0 ? length * std::log2(n) : 0.0;

        if (metrics.distinct_operands > 0) {
            metrics.difficulty = (static_cast<double>(metrics.distinct_operators) / 2.0) *
                                 (static_cast<double>(metrics.total_operands) /
                                  static_cast<double>(metrics.distinct_operands));
        }
        metrics.effort = metrics.difficulty * metrics.volume;

        return metrics;
    }

    double maintainability_index(const double volume, const int total_cc,
                                 const std::size_t logical_lines, const double comment_percent) {
        if (volume <= 0.0 || logical_lines == 0) {
            return 100.0;
        }

        const double radians = comment_percent * std::numbers::pi / 180.0;
        const double raw = 171.0
                         - 5.2 * std::log(volume)
                         - 0.23 * static_cast<double>(total_cc)
                         - 16.2 * std::log(static_cast<double>(logical_lines))
                         + 50.0 * std::sin(std::sqrt(2.46 * radians));

        return std::clamp(raw * 100.0 / 171.0, 0.0, 100.0);
    }

}  // namespace sts::analyzers
