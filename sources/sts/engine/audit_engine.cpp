//
// Created by gregorian-rayne on 10/10/26.
//

#include "sts/engine/audit_engine.hpp"
#include "sts/engine/source_collector.hpp"
#include "sts/engine/verdict.hpp"
#include "sts/analyzers/complexity_analyzer.hpp"
#include "sts/analyzers/drift_detector.hpp"
#include "sts/analyzers/lag_detector.hpp"
#include "sts/utils/file_utils.hpp"
#include "sts/utils/string_utils.hpp"
#include "sts/utils/parallel.hpp"

#include <algorithm>

namespace sts::engine {

    namespace {

        constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

        std::string describe(const Error& error) {
            if (error.has_context()) {
                return error.message() + " (" + *error.context() + ")";
            }
            return error.message();
        }

        bool is_cancelled(const std::atomic<bool>* flag) {
            return flag != nullptr && flag->load();
        }

    }  // namespace

    FileMetrics measure_file(const fs::path& path,
                             const policy::PolicyConfig& policy,
                             const analyzers::IHistoryProvider* history) {
        FileMetrics metrics;
        metrics.path = path;

        if (history != nullptr) {
            auto churn = analyzers::analyze_churn(path, *history, policy.churn);
            metrics.ccr = churn.ccr;
            metrics.churn_touches = churn.touches;
            metrics.churn_note = std::move(churn.note);
        } else {
            metrics.churn_note = "churn disabled";
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            metrics.analysis_error = describe(content.error());
            return metrics;
        }

        std::string_view text = content.value();
        if (string_utils::starts_with(text, UTF8_BOM)) {
            text.remove_prefix(UTF8_BOM.size());
        }

        if (auto complexity = analyzers::analyze_complexity(text); complexity.is_ok()) {
            auto& report = complexity.value();
            metrics.max_cc = report.max_cc;
            metrics.mean_cc = report.mean_cc;
            metrics.units = std::move(report.units);
            metrics.halstead_effort = report.halstead.effort;
            metrics.halstead_difficulty = report.halstead.difficulty;
            metrics.maintainability_index = report.maintainability_index;
        } else {
            metrics.analysis_error = describe(complexity.error());
        }

        const auto drift = analyzers::detect_drift(text, policy.illegal_patterns);
        metrics.adf = drift.adf;
        metrics.drift_lines = drift.matching_lines;
        metrics.counted_lines = drift.counted_lines;

        auto lag = analyzers::detect_lag(text, policy.legacy_api_patterns);
        metrics.technical_lag = lag.lag;
        metrics.tl_lines = std::move(lag.line_numbers);

        return metrics;
    }

    Result<AuditRun, Error> run_audit(const AuditOptions& options) {
        const auto start_time = std::chrono::steady_clock::now();
        const auto& target = options.target;

        if (std::error_code ec; !fs::exists(target, ec)) {
            return Result<AuditRun, Error>::failure(
                Error::not_found("Target not found", target.string())
            );
        }

        auto loaded = policy::resolve(target, options.config_path);
        if (loaded.is_err()) {
            return Result<AuditRun, Error>::failure(loaded.error());
        }

        AuditRun run;
        run.policy = std::move(loaded.value().config);
        run.warnings = std::move(loaded.value().warnings);

        std::vector<fs::path> files;
        std::error_code ec;

        if (fs::is_regular_file(target, ec)) {
            run.report.mode = AuditMode::SingleFile;
            files.push_back(target);
        } else if (fs::is_directory(target, ec)) {
            run.report.mode = AuditMode::Directory;

            auto collected = collect_sources(target, run.policy);
            if (collected.is_err()) {
                return Result<AuditRun, Error>::failure(collected.error());
            }
            files = std::move(collected.value().files);
            run.warnings.insert(run.warnings.end(),
                                collected.value().warnings.begin(),
                                collected.value().warnings.end());

            if (files.empty()) {
                return Result<AuditRun, Error>::failure(
                    Error::invalid_argument("No Python source files found", target.string())
                );
            }
        } else {
            return Result<AuditRun, Error>::failure(
                Error::invalid_argument("Target is neither a file nor a directory", target.string())
            );
        }

        std::shared_ptr<const analyzers::IHistoryProvider> history;
        if (options.churn_enabled) {
            history = options.history;
            if (!history) {
                history = std::make_shared<analyzers::GitHistoryProvider>(
                    std::chrono::seconds(run.policy.churn.timeout_seconds),
                    options.cancelled
                );
            }
        }

        std::vector<FileMetrics> measured;
        {
            const auto workers = std::min<std::size_t>(
                options.jobs == 0 ? parallel::hardware_concurrency() : options.jobs,
                files.size()
            );
            parallel::ThreadPool pool(static_cast<unsigned int>(workers));
            const auto& policy = run.policy;
            const auto* provider = history.get();
            const auto* cancelled = options.cancelled;

            measured = parallel::map(files, [&policy, provider, cancelled](const fs::path& path) {
                if (is_cancelled(cancelled)) {
                    FileMetrics skipped;
                    skipped.path = path;
                    return skipped;
                }
                return measure_file(path, policy, provider);
            }, pool);
        }

        if (is_cancelled(options.cancelled)) {
            return Result<AuditRun, Error>::failure(Error::cancelled("Audit interrupted"));
        }

        auto& report = run.report;
        report.target = target;
        report.config_source = run.policy.source;
        report.files.reserve(measured.size());
        for (auto& metrics : measured) {
            report.files.push_back(judge_file(std::move(metrics), run.policy));
        }
        std::ranges::sort(report.files, {}, [](const FileVerdict& v) -> const fs::path& {
            return v.metrics.path;
        });

        if (report.mode == AuditMode::Directory) {
            report.project = judge_project(report.files, run.policy);
        }

        report.generated_at = std::chrono::system_clock::now();
        report.analysis_duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start_time
        );

        return Result<AuditRun, Error>::success(std::move(run));
    }

}  // namespace sts::engine
