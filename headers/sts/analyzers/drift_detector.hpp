//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef STS_DRIFT_DETECTOR_HPP
#define STS_DRIFT_DETECTOR_HPP

/**
 * @file drift_detector.hpp
 * @brief Architecture drift factor (ADF).
 *
 * ADF is the share of non-blank lines that match the illegal-pattern set,
 * e.g. presentation calls inside a service layer. Blank lines never count
 * towards the denominator, so padding a file with blank lines does not
 * dilute its score. A file with no non-blank lines has ADF 0.
 */

#include "sts/analyzers/analyzer.hpp"
#include "sts/policy/policy.hpp"

#include <string_view>

namespace sts::analyzers {

    DriftResult detect_drift(std::string_view source, const policy::PatternSet& illegal_patterns);

}  // namespace sts::analyzers

#endif //STS_DRIFT_DETECTOR_HPP
