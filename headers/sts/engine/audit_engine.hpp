//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef STS_AUDIT_ENGINE_HPP
#define STS_AUDIT_ENGINE_HPP

/**
 * @file audit_engine.hpp
 * @brief Runs a complete audit: policy, collection, measurement, verdicts.
 *
 * Pipeline:
 *   target -> policy -> file list -> per-file measurement (thread pool)
 *          -> file verdicts -> project verdict (directory mode)
 *
 * The policy is resolved before any worker starts and is only read
 * afterwards. Output order is the sorted file order, independent of
 * scheduling.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"
#include "sts/types.hpp"
#include "sts/policy/policy.hpp"
#include "sts/analyzers/churn_analyzer.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sts::engine {

    struct AuditOptions {
        fs::path target;
        std::optional<fs::path> config_path;
        unsigned int jobs = 0;                       ///< 0 means hardware concurrency
        bool churn_enabled = true;
        const std::atomic<bool>* cancelled = nullptr;

        /// Replaces the git provider, e.g. with a fake in tests.
        std::shared_ptr<const analyzers::IHistoryProvider> history;
    };

    /**
     * Everything a caller needs to report on a finished run.
     */
    struct AuditRun {
        AuditReport report;
        policy::PolicyConfig policy;
        std::vector<std::string> warnings;
    };

    /**
     * Measures one file. Never fails: problems are recorded in the metrics
     * (analysis_error, unknown ccr).
     *
     * @param history Churn source, or nullptr to leave ccr unknown.
     */
    FileMetrics measure_file(const fs::path& path,
                             const policy::PolicyConfig& policy,
                             const analyzers::IHistoryProvider* history);

    /**
     * Runs the audit described by options.
     *
     * @return The run, or an operational error: missing target, bad
     *         policy, no source files, or Cancelled after an interrupt.
     */
    Result<AuditRun, Error> run_audit(const AuditOptions& options);

}  // namespace sts::engine

#endif //STS_AUDIT_ENGINE_HPP
