//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef STS_TYPES_HPP
#define STS_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures of an audit run.
 *
 * - Basic Types: Duration, Timestamp
 * - Measurement: SourceUnit, FileMetrics
 * - Verdicts: FileVerdict, ProjectVerdict, AuditReport
 *
 * Measurement and verdict types are plain values. They are created once
 * per file per run and never mutated afterwards, so they can be produced
 * on worker threads and moved into the run's result collection.
 */

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sts {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Process exit codes consumed by CI callers.
     */
    namespace exit_codes {
        constexpr int Pass = 0;
        constexpr int Fail = 1;
        constexpr int OperationalError = 2;
        constexpr int Interrupted = 130;
    }

    // ============================================================================
    // Measurement
    // ============================================================================

    /**
     * Binary modernization flag.
     */
    enum class TechnicalLag {
        Low,
        High
    };

    inline const char* to_string(const TechnicalLag lag) noexcept {
        switch (lag) {
            case TechnicalLag::Low:  return "LOW";
            case TechnicalLag::High: return "HIGH";
        }
        return "LOW";
    }

    /**
     * A function or method extracted from one file.
     */
    struct SourceUnit {
        std::string name;             // Qualified, e.g. "Cart.total" or "<module>"
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        int complexity = 1;
    };

    /**
     * Aggregated measurements for one file.
     *
     * max_cc/mean_cc are empty when the file could not be parsed; ccr is
     * empty when the history could not be queried. Neither ever defaults
     * to zero.
     */
    struct FileMetrics {
        fs::path path;

        // Complexity
        std::optional<int> max_cc;
        std::optional<double> mean_cc;
        std::vector<SourceUnit> units;

        // Drift
        double adf = 0.0;
        std::size_t drift_lines = 0;
        std::size_t counted_lines = 0;

        // Churn
        std::optional<double> ccr;
        std::optional<std::size_t> churn_touches;
        std::string churn_note;

        // Lag
        TechnicalLag technical_lag = TechnicalLag::Low;
        std::vector<std::size_t> tl_lines;

        // Advisory
        double halstead_effort = 0.0;
        double halstead_difficulty = 0.0;
        double maintainability_index = 100.0;

        std::optional<std::string> analysis_error;

        [[nodiscard]] bool parsed() const noexcept {
            return max_cc.has_value();
        }
    };

    // ============================================================================
    // Verdicts
    // ============================================================================

    /**
     * Binary outcome for one file.
     */
    struct FileVerdict {
        FileMetrics metrics;
        bool is_failed = false;
        bool degraded = false;            // ccr unknown, verdict on remaining predicates
        std::vector<std::string> reasons;
    };

    /**
     * Binary outcome for a scanned tree, folded from all FileMetrics.
     */
    struct ProjectVerdict {
        std::size_t total_files = 0;
        std::size_t unparseable_files = 0;
        std::size_t unknown_ccr_files = 0;

        int max_cc_overall = 0;
        double mean_cc = 0.0;
        double max_adf_overall = 0.0;
        std::vector<fs::path> polluted_files;

        std::optional<double> mean_ccr;
        std::optional<double> max_ccr;

        TechnicalLag global_technical_lag = TechnicalLag::Low;
        std::vector<std::string> tl_instances;

        bool is_failed = false;
        std::vector<std::string> reasons;
    };

    enum class AuditMode {
        SingleFile,
        Directory
    };

    inline const char* to_string(const AuditMode mode) noexcept {
        switch (mode) {
            case AuditMode::SingleFile: return "file";
            case AuditMode::Directory:  return "directory";
        }
        return "file";
    }

    /**
     * Full output of one run.
     */
    struct AuditReport {
        fs::path target;
        AuditMode mode = AuditMode::SingleFile;
        std::string config_source;
        Timestamp generated_at;
        Duration analysis_duration = Duration::zero();

        std::vector<FileVerdict> files;     // Sorted by path
        std::optional<ProjectVerdict> project;

        /**
         * Project verdict in directory mode, file verdict otherwise.
         */
        [[nodiscard]] bool is_failed() const noexcept {
            if (mode == AuditMode::Directory) {
                return project.has_value() && project->is_failed;
            }
            for (const auto& file : files) {
                if (file.is_failed) return true;
            }
            return false;
        }

        [[nodiscard]] int exit_code() const noexcept {
            return is_failed() ? exit_codes::Fail : exit_codes::Pass;
        }
    };

}  // namespace sts

#endif //STS_TYPES_HPP
