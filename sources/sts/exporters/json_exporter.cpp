//
// Created by gregorian-rayne on 10/11/26.
//

#include "sts/exporters/json_exporter.hpp"
#include "sts/analyzers/lag_detector.hpp"
#include "sts/engine/verdict.hpp"
#include "sts/utils/file_utils.hpp"
#include "sts/version.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sts::exporters {

    using json = nlohmann::json;

    namespace {

        double round_to(const double value, const int digits) {
            const double scale = std::pow(10.0, digits);
            return std::round(value * scale) / scale;
        }

        template<typename T>
        json nullable(const std::optional<T>& value) {
            return value.has_value() ? json(*value) : json(nullptr);
        }

        json nullable_ratio(const std::optional<double>& value) {
            return value.has_value() ? json(round_to(*value, 4)) : json(nullptr);
        }

        json file_to_json(const FileVerdict& verdict) {
            const auto& m = verdict.metrics;

            json entry;
            entry["path"] = m.path.string();
            entry["max_cc"] = nullable(m.max_cc);
            entry["mean_cc"] = m.mean_cc.has_value() ? json(round_to(*m.mean_cc, 2)) : json(nullptr);
            entry["adf"] = round_to(m.adf, 4);
            entry["drift_lines"] = m.drift_lines;
            entry["ccr"] = nullable_ratio(m.ccr);
            entry["churn_touches"] = nullable(m.churn_touches);
            entry["technical_lag"] = to_string(m.technical_lag);
            entry["tl_instances"] = analyzers::lag_evidence(m.path, m.tl_lines);
            entry["halstead_effort"] = round_to(m.halstead_effort, 2);
            entry["halstead_difficulty"] = round_to(m.halstead_difficulty, 2);
            entry["maintainability_index"] = round_to(m.maintainability_index, 2);
            entry["failed"] = verdict.is_failed;
            entry["degraded"] = verdict.degraded;
            entry["verdict"] = engine::verdict_label(verdict.is_failed);
            entry["reasons"] = verdict.reasons;
            entry["error"] = nullable(m.analysis_error);

            json units = json::array();
            for (const auto& unit : m.units) {
                units.push_back({
                    {"name", unit.name},
                    {"start_line", unit.start_line},
                    {"end_line", unit.end_line},
                    {"complexity", unit.complexity}
                });
            }
            entry["units"] = units;

            return entry;
        }

        json project_to_json(const ProjectVerdict& project) {
            json polluted = json::array();
            for (const auto& path : project.polluted_files) {
                polluted.push_back(path.string());
            }

            json entry;
            entry["total_files"] = project.total_files;
            entry["unparseable_files"] = project.unparseable_files;
            entry["max_cc"] = project.max_cc_overall;
            entry["mean_cc"] = round_to(project.mean_cc, 2);
            entry["max_adf"] = round_to(project.max_adf_overall, 4);
            entry["polluted_files"] = polluted;
            entry["mean_ccr"] = nullable_ratio(project.mean_ccr);
            entry["max_ccr"] = nullable_ratio(project.max_ccr);
            entry["unknown_ccr_files"] = project.unknown_ccr_files;
            entry["global_tl"] = to_string(project.global_technical_lag);
            entry["tl_instances"] = project.tl_instances;
            entry["failed"] = project.is_failed;
            entry["verdict"] = engine::verdict_label(project.is_failed);
            entry["reasons"] = project.reasons;
            return entry;
        }

    }  // namespace

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);

        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    json JsonExporter::to_json(const AuditReport& report) const {
        json output;
        output["tool"] = PROJECT_SHORT_NAME;
        output["version"] = VERSION_STRING;
        output["target"] = report.target.string();
        output["mode"] = to_string(report.mode);
        output["config_source"] = report.config_source;
        output["generated_at"] = format_timestamp(report.generated_at);
        output["analysis_duration_ms"] = round_to(
            static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(report.analysis_duration).count()) / 1000.0,
            3
        );

        json files = json::array();
        for (const auto& file : report.files) {
            files.push_back(file_to_json(file));
        }
        output["files"] = files;

        output["project"] = report.project.has_value() ? project_to_json(*report.project) : json(nullptr);
        output["exit_code"] = report.exit_code();

        return output;
    }

    Result<std::string, Error> JsonExporter::export_to_string(
        const AuditReport& report,
        const ExportOptions& options
    ) const {
        try {
            const auto output = to_json(report);
            return Result<std::string, Error>::success(
                options.pretty_print ? output.dump(options.indent) : output.dump()
            );
        } catch (const json::exception& e) {
            return Result<std::string, Error>::failure(
                Error::internal_error(std::string("Failed to serialize report: ") + e.what())
            );
        }
    }

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const AuditReport& report,
        const ExportOptions& options
    ) const {
        auto text = export_to_string(report, options);
        if (text.is_err()) {
            return Result<void, Error>::failure(text.error());
        }

        stream << text.value() << "\n";
        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write report"));
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> JsonExporter::export_to_file(
        const fs::path& path,
        const AuditReport& report,
        const ExportOptions& options
    ) const {
        auto text = export_to_string(report, options);
        if (text.is_err()) {
            return Result<void, Error>::failure(text.error());
        }
        return file_utils::write_file(path, text.value() + "\n");
    }

    Result<void, Error> validate_output_path(const fs::path& output, const AuditReport& report) {
        if (output.empty()) {
            return Result<void, Error>::failure(Error::invalid_argument("Output path is empty"));
        }

        if (std::error_code ec; fs::is_directory(output, ec)) {
            return Result<void, Error>::failure(
                Error::invalid_argument("Output path is a directory", output.string())
            );
        }

        if (report.mode == AuditMode::Directory && file_utils::is_within(output, report.target)) {
            return Result<void, Error>::failure(
                Error::invalid_argument("Output path is inside the scanned tree", output.string())
            );
        }

        if (report.mode == AuditMode::SingleFile &&
            file_utils::normalize(output) == file_utils::normalize(report.target)) {
            return Result<void, Error>::failure(
                Error::invalid_argument("Output path would overwrite the audited file", output.string())
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace sts::exporters
