//
// Created by gregorian-rayne on 10/8/26.
//

#include "sts/analyzers/drift_detector.hpp"
#include "sts/utils/string_utils.hpp"

namespace sts::analyzers {

    DriftResult detect_drift(const std::string_view source, const policy::PatternSet& illegal_patterns) {
        DriftResult result;

        const auto lines = string_utils::split_lines(source);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (string_utils::is_blank(lines[i])) {
                continue;
            }
            ++result.counted_lines;

            if (illegal_patterns.matches(lines[i])) {
                ++result.matching_lines;
                result.line_numbers.push_back(i + 1);
            }
        }

        if (result.counted_lines > 0) {
            result.adf = static_cast<double>(result.matching_lines) /
                         static_cast<double>(result.counted_lines);
        }

        return result;
    }

}  // namespace sts::analyzers
