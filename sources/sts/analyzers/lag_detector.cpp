//
// Created by gregorian-rayne on 10/8/26.
//

#include "sts/analyzers/lag_detector.hpp"
#include "sts/utils/string_utils.hpp"

namespace sts::analyzers {

    LagResult detect_lag(const std::string_view source, const policy::PatternSet& legacy_api_patterns) {
        LagResult result;

        const auto lines = string_utils::split_lines(source);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (legacy_api_patterns.matches(lines[i])) {
                result.line_numbers.push_back(i + 1);
            }
        }

        result.lag = result.line_numbers.empty() ? TechnicalLag::Low : TechnicalLag::High;
        return result;
    }

    std::vector<std::string> lag_evidence(const fs::path& path, const std::vector<std::size_t>& line_numbers) {
        std::vector<std::string> evidence;
        evidence.reserve(line_numbers.size());
        for (const auto line : line_numbers) {
            evidence.push_back(path.string() + ":" + std::to_string(line));
        }
        return evidence;
    }

}  // namespace sts::analyzers
