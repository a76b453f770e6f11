//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef STS_LAG_DETECTOR_HPP
#define STS_LAG_DETECTOR_HPP

/**
 * @file lag_detector.hpp
 * @brief Technical lag (TL): use of deprecated APIs.
 *
 * TL is HIGH when any line matches the legacy-API pattern set. It never
 * fails a file on its own; it only feeds the project verdict.
 */

#include "sts/analyzers/analyzer.hpp"
#include "sts/policy/policy.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sts::analyzers {

    LagResult detect_lag(std::string_view source, const policy::PatternSet& legacy_api_patterns);

    /**
     * Formats lag evidence as "path:line" entries.
     */
    std::vector<std::string> lag_evidence(const fs::path& path, const std::vector<std::size_t>& line_numbers);

}  // namespace sts::analyzers

#endif //STS_LAG_DETECTOR_HPP
