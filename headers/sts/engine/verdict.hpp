//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef STS_VERDICT_HPP
#define STS_VERDICT_HPP

/**
 * @file verdict.hpp
 * @brief Per-file and project verdicts.
 *
 * A file fails when it is unparseable, or when its complexity, drift
 * density or known churn rate exceeds the policy threshold. An unknown
 * churn rate is left out of the verdict and recorded as a note.
 *
 * The project verdict is a second, independent fold over all file metrics
 * and is stricter: the complexity and drift ceilings fail when reached,
 * any technical lag fails, and any unparseable file fails.
 */

#include "sts/types.hpp"
#include "sts/policy/policy.hpp"

#include <vector>

namespace sts::engine {

    namespace reasons {
        constexpr auto UNPARSEABLE = "unparseable";
        constexpr auto MAX_CC_EXCEEDED = "max_cc exceeded";
        constexpr auto ADF_EXCEEDED = "adf exceeded";
        constexpr auto CCR_EXCEEDED = "ccr exceeded";
        constexpr auto CCR_UNKNOWN = "ccr unknown (excluded from verdict)";

        constexpr auto PROJECT_MAX_CC_REACHED = "project max_cc reached";
        constexpr auto PROJECT_ADF_REACHED = "adf threshold reached";
        constexpr auto PROJECT_TECHNICAL_LAG = "technical lag HIGH";
        constexpr auto PROJECT_CCR_EXCEEDED = "ccr exceeded";
        constexpr auto PROJECT_UNPARSEABLE = "unparseable files present";
    }

    /**
     * Judges one file. Reasons are ordered: unparseable, max_cc, adf, ccr,
     * then the unknown-ccr note.
     */
    FileVerdict judge_file(FileMetrics metrics, const policy::PolicyConfig& policy);

    /**
     * Folds all file metrics into the project verdict.
     *
     * max_cc_overall and mean_cc (mean of per-file maxima) cover parseable
     * files only; mean_ccr and max_ccr cover files with known churn and are
     * empty when there are none.
     */
    ProjectVerdict judge_project(const std::vector<FileVerdict>& files, const policy::PolicyConfig& policy);

    /**
     * Tier label used in terminal output.
     */
    inline const char* verdict_label(const bool failed) noexcept {
        return failed ? "H-TIER (FAILED)" : "Z-TIER (PASSED)";
    }

}  // namespace sts::engine

#endif //STS_VERDICT_HPP
