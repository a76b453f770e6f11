//
// Created by gregorian-rayne on 10/10/26.
//

#include "sts/engine/verdict.hpp"
#include "sts/analyzers/lag_detector.hpp"

#include <algorithm>

namespace sts::engine {

    FileVerdict judge_file(FileMetrics metrics, const policy::PolicyConfig& policy) {
        FileVerdict verdict;
        const auto& t = policy.thresholds;

        if (!metrics.parsed()) {
            verdict.reasons.emplace_back(reasons::UNPARSEABLE);
        } else if (*metrics.max_cc > t.max_cc) {
            verdict.reasons.emplace_back(reasons::MAX_CC_EXCEEDED);
        }

        if (metrics.adf > t.adf_threshold) {
            verdict.reasons.emplace_back(reasons::ADF_EXCEEDED);
        }

        if (metrics.ccr.has_value() && *metrics.ccr > t.ccr_threshold) {
            verdict.reasons.emplace_back(reasons::CCR_EXCEEDED);
        }

        verdict.is_failed = !verdict.reasons.empty();

        if (!metrics.ccr.has_value()) {
            verdict.degraded = true;
            verdict.reasons.emplace_back(reasons::CCR_UNKNOWN);
        }

        verdict.metrics = std::move(metrics);
        return verdict;
    }

    ProjectVerdict judge_project(const std::vector<FileVerdict>& files, const policy::PolicyConfig& policy) {
        ProjectVerdict project;
        project.total_files = files.size();

        std::size_t parsed_files = 0;
        long long cc_sum = 0;
        std::size_t ccr_files = 0;
        double ccr_sum = 0.0;

        for (const auto& file : files) {
            const auto& m = file.metrics;

            if (m.parsed()) {
                ++parsed_files;
                cc_sum += *m.max_cc;
                project.max_cc_overall = std::max(project.max_cc_overall, *m.max_cc);
            } else {
                ++project.unparseable_files;
            }

            project.max_adf_overall = std::max(project.max_adf_overall, m.adf);
            if (m.adf > 0.0) {
                project.polluted_files.push_back(m.path);
            }

            if (m.ccr.has_value()) {
                ++ccr_files;
                ccr_sum += *m.ccr;
                project.max_ccr = std::max(project.max_ccr.value_or(0.0), *m.ccr);
            } else {
                ++project.unknown_ccr_files;
            }

            auto evidence = analyzers::lag_evidence(m.path, m.tl_lines);
            project.tl_instances.insert(project.tl_instances.end(),
                                        std::make_move_iterator(evidence.begin()),
                                        std::make_move_iterator(evidence.end()));
        }

        if (parsed_files > 0) {
            project.mean_cc = static_cast<double>(cc_sum) / static_cast<double>(parsed_files);
        }
        if (ccr_files > 0) {
            project.mean_ccr = ccr_sum / static_cast<double>(ccr_files);
        }
        project.global_technical_lag = project.tl_instances.empty() ? TechnicalLag::Low : TechnicalLag::High;

        const auto& t = policy.thresholds;

        if (project.max_cc_overall >= t.project_max_cc) {
            project.reasons.emplace_back(reasons::PROJECT_MAX_CC_REACHED);
        }
        if (project.max_adf_overall >= t.adf_threshold) {
            project.reasons.emplace_back(reasons::PROJECT_ADF_REACHED);
        }
        if (project.global_technical_lag == TechnicalLag::High) {
            project.reasons.emplace_back(reasons::PROJECT_TECHNICAL_LAG);
        }
        if (project.max_ccr.has_value() && *project.max_ccr > t.ccr_threshold) {
            project.reasons.emplace_back(reasons::PROJECT_CCR_EXCEEDED);
        }
        if (project.unparseable_files > 0) {
            project.reasons.emplace_back(reasons::PROJECT_UNPARSEABLE);
        }

        project.is_failed = !project.reasons.empty();
        return project;
    }

}  // namespace sts::engine
