//
// Created by gregorian-rayne on 10/8/26.
//

#include "sts/analyzers/complexity_analyzer.hpp"
#include "sts/analyzers/halstead.hpp"

#include <algorithm>
#include <numeric>

namespace sts::analyzers {

    using python::ClauseKind;
    using python::ScopeKind;
    using python::TokenType;

    int decision_points(const python::ModuleStructure& module, const python::Statement& statement) {
        int points = 0;

        switch (statement.kind) {
            case ClauseKind::If:
            case ClauseKind::Elif:
            case ClauseKind::For:
            case ClauseKind::While:
            case ClauseKind::Except:
            case ClauseKind::LoopElse:
            case ClauseKind::TryElse:
                points = 1;
                break;
            case ClauseKind::Case:
                points = statement.irrefutable ? 0 : 1;
                break;
            default:
                break;
        }

        // Skip the clause keyword itself; what follows is expression text.
        std::size_t first = statement.begin;
        if (statement.kind != ClauseKind::Simple) {
            first += statement.is_async ? 2 : 1;
        }

        for (std::size_t k = first; k < statement.end; ++k) {
            const auto& tok = module.tokens[k];
            if (tok.type != TokenType::Name) {
                continue;
            }
            if (tok.text == "and" || tok.text == "or" || tok.text == "for") {
                ++points;
            } else if (tok.text == "if" && statement.kind != ClauseKind::Case) {
                ++points;   // conditional expression or comprehension filter
            }
        }

        return points;
    }

    ComplexityResult analyze_complexity(const python::ModuleStructure& module) {
        std::vector<int> scope_decisions(module.scopes.size(), 0);
        for (const auto& statement : module.statements) {
            scope_decisions[statement.scope] += decision_points(module, statement);
        }

        ComplexityResult result;

        for (std::size_t s = 0; s < module.scopes.size(); ++s) {
            const auto& scope = module.scopes[s];
            const int complexity = 1 + scope_decisions[s];
            result.total_cc += complexity;

            if (scope.kind == ScopeKind::Module && scope_decisions[s] == 0) {
                continue;
            }
            result.units.push_back(SourceUnit{scope.name, scope.start_line, scope.end_line, complexity});
        }

        if (!result.units.empty()) {
            const auto worst = std::ranges::max_element(result.units, {}, &SourceUnit::complexity);
            result.max_cc = worst->complexity;

            const int sum = std::accumulate(result.units.begin(), result.units.end(), 0,
                [](const int acc, const SourceUnit& u) { return acc + u.complexity; });
            result.mean_cc = static_cast<double>(sum) / static_cast<double>(result.units.size());
        }

        result.halstead = compute_halstead(module.tokens);

        const auto& raw = module.raw;
        const double comment_percent = raw.sloc > 0
            ? static_cast<double>(raw.comments + raw.multi) / static_cast<double>(raw.sloc) * 100.0
            : 0.0;
        result.maintainability_index = maintainability_index(
            result.halstead.volume, result.total_cc, raw.lloc, comment_percent);

        return result;
    }

    Result<ComplexityResult, Error> analyze_complexity(const std::string_view source) {
        auto module = python::parse_module(source);
        if (module.is_err()) {
            return Result<ComplexityResult, Error>::failure(module.error());
        }
        return Result<ComplexityResult, Error>::success(analyze_complexity(module.value()));
    }

}  // namespace sts::analyzers
