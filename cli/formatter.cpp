//
// Created by gregorian-rayne on 10/12/26.
//

#include "sts/cli/formatter.hpp"
#include "sts/engine/verdict.hpp"
#include "sts/analyzers/lag_detector.hpp"
#include "sts/utils/string_utils.hpp"
#include "sts/version.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace sts::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    namespace {

        constexpr std::size_t DETAIL_WIDTH = 50;
        constexpr std::size_t PROJECT_WIDTH = 70;
        constexpr std::size_t PATH_COLUMN_WIDTH = 40;

        /// Shortest decimal form of a threshold: 0.05, 0.3, 1.
        std::string format_threshold(const double value) {
            std::string text = string_utils::format_fixed(value, 4);
            while (!text.empty() && text.back() == '0') {
                text.pop_back();
            }
            if (!text.empty() && text.back() == '.') {
                text.pop_back();
            }
            return text;
        }

        std::string format_cc(const FileMetrics& metrics) {
            return metrics.max_cc.has_value() ? std::to_string(*metrics.max_cc) : "-";
        }

        std::string colorize_lag(const TechnicalLag lag) {
            return lag == TechnicalLag::High
                ? colorize(to_string(lag), colors::YELLOW)
                : std::string(to_string(lag));
        }

    }  // namespace

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_path(const fs::path& path, const std::size_t max_width) {
        std::string str = path.string();
        if (str.length() <= max_width) {
            return str;
        }

        const std::string ellipsis = "...";
        return ellipsis + str.substr(str.length() - max_width + ellipsis.length());
    }

    std::string format_percent(const double ratio, const int precision) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(precision) << (ratio * 100.0) << "%";
        return ss.str();
    }

    std::string format_optional_percent(const std::optional<double>& ratio) {
        return ratio.has_value() ? format_percent(*ratio) : "n/a";
    }

    std::string colorize(const std::string_view text, const char* color) {
        if (!colors::enabled()) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + colors::RESET;
    }

    std::string colorize_outcome(const bool failed) {
        if (!colors::enabled()) {
            return failed ? "FAIL" : "PASS";
        }
        return failed
            ? std::string(colors::RED) + colors::BOLD + "FAIL" + colors::RESET
            : std::string(colors::GREEN) + colors::BOLD + "PASS" + colors::RESET;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width == 0) {
                std::size_t max_width = columns_[i].header.length();
                for (const auto& row : rows_) {
                    if (i < row.size() && row[i].length() > max_width) {
                        max_width = row[i].length();
                    }
                }
                columns_[i].width = max_width;
            }
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                const bool last = i + 1 == temp.columns_.size();
                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else if (last) {
                    out << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (!last) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i + 1 < temp.columns_.size()) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (const auto& row : temp.rows_) {
            render_row(row, false);
        }
    }

    // ============================================================================
    // ReportPrinter Implementation
    // ============================================================================

    ReportPrinter::ReportPrinter(std::ostream& out, const policy::PolicyConfig& policy)
        : out_(out)
        , policy_(policy)
    {}

    void ReportPrinter::print_section(const std::string_view title) const {
        if (colors::enabled()) {
            out_ << colors::BOLD << title << colors::RESET << "\n";
        } else {
            out_ << title << "\n";
        }
    }

    void ReportPrinter::print_report(const AuditReport& report) const {
        if (report.mode == AuditMode::SingleFile) {
            const std::string rule(DETAIL_WIDTH, '=');
            out_ << rule << "\n";
            out_ << "        STS ARCHITECTURAL AUDIT v" << VERSION_STRING << "\n";
            out_ << rule << "\n";
            print_file_table(report.files);
            for (const auto& file : report.files) {
                print_file_detail(file);
            }
        } else {
            const std::string rule(PROJECT_WIDTH, '=');
            out_ << rule << "\n";
            out_ << "        STS PROJECT AUDIT v" << VERSION_STRING << "\n";
            out_ << rule << "\n";
            out_ << "  Target: " << report.target.string() << "\n";
            out_ << "  Policy: " << report.config_source << "\n";
            out_ << "  Files scanned: " << report.files.size() << "\n";
            out_ << std::string(PROJECT_WIDTH, '-') << "\n";
            print_file_table(report.files);
            if (report.project.has_value()) {
                print_project_summary(*report.project);
            }
        }

        print_outcome(report);
    }

    void ReportPrinter::print_file_table(const std::vector<FileVerdict>& files) const {
        Table table({
            {"File", PATH_COLUMN_WIDTH, false},
            {"CC", 0, true},
            {"ADF", 0, true},
            {"CCR", 0, true},
            {"TL", 0, false},
            {"Verdict", 0, false},
            {"Reasons", 0, false},
        });

        // Color codes would break column alignment, so cells stay plain
        for (const auto& file : files) {
            const auto& m = file.metrics;
            table.add_row({
                format_path(m.path, PATH_COLUMN_WIDTH),
                format_cc(m),
                string_utils::format_fixed(m.adf, 4),
                format_optional_percent(m.ccr),
                std::string(to_string(m.technical_lag)),
                file.is_failed ? "FAIL" : "PASS",
                string_utils::join(file.reasons, "; "),
            });
        }

        table.render(out_);
        out_ << "\n";
    }

    void ReportPrinter::print_file_detail(const FileVerdict& verdict) const {
        const auto& m = verdict.metrics;
        const auto& t = policy_.thresholds;
        const std::string rule(DETAIL_WIDTH, '-');

        out_ << "Target: " << m.path.string() << "\n";
        out_ << "Verdict: [" << colorize(engine::verdict_label(verdict.is_failed),
                                         verdict.is_failed ? colors::RED : colors::GREEN) << "]\n";
        out_ << rule << "\n";

        print_section("[Core Metrics]");
        if (m.parsed()) {
            out_ << "  Max Cyclomatic Complexity : " << *m.max_cc << " (Limit: " << t.max_cc << ")\n";
            out_ << "  Maintainability Index     : " << string_utils::format_fixed(m.maintainability_index)
                 << " (Limit: 20+)\n";
            out_ << "  Halstead Effort           : " << string_utils::format_fixed(m.halstead_effort) << "\n";
            for (const auto& unit : m.units) {
                out_ << "    " << colorize(unit.name, colors::DIM) << " [" << unit.start_line << "-"
                     << unit.end_line << "] cc=" << unit.complexity << "\n";
            }
        } else {
            out_ << "  Max Cyclomatic Complexity : unparseable\n";
            if (m.analysis_error.has_value()) {
                out_ << "    -> " << *m.analysis_error << "\n";
            }
        }
        out_ << rule << "\n";

        print_section("[2026 Consensus Audit]");
        out_ << "  Code Churn Rate (CCR)     : ";
        if (m.ccr.has_value()) {
            out_ << format_percent(*m.ccr) << " (Limit: " << format_percent(t.ccr_threshold, 0) << ")\n";
        } else {
            out_ << "unknown (" << m.churn_note << ")\n";
        }
        out_ << "  Architecture Drift (ADF)  : " << string_utils::format_fixed(m.adf, 4)
             << " (Limit: " << format_threshold(t.adf_threshold) << ")\n";
        out_ << "  Technical Lag (TL)        : " << colorize_lag(m.technical_lag) << "\n";
        for (const auto& instance : analyzers::lag_evidence(m.path, m.tl_lines)) {
            out_ << "    -> " << instance << "\n";
        }
        out_ << rule << "\n";

        if (verdict.is_failed) {
            out_ << "FINDING : Architectural integrity compromised.\n";
            out_ << "ACTION  : REJECT DELIVERY / MANDATORY REFACTORING.\n";
        } else {
            out_ << "FINDING : Architecture is healthy and scalable.\n";
        }
        out_ << std::string(DETAIL_WIDTH, '=') << "\n";
    }

    void ReportPrinter::print_project_summary(const ProjectVerdict& project) const {
        const auto& t = policy_.thresholds;

        print_section("[Project Summary]");
        out_ << "  Max CC (across all files) : " << project.max_cc_overall << "\n";
        out_ << "  Mean CC                   : " << string_utils::format_fixed(project.mean_cc, 1) << "\n";
        out_ << "  Max ADF                   : " << string_utils::format_fixed(project.max_adf_overall, 4) << "\n";
        if (!project.polluted_files.empty()) {
            out_ << "  Polluted files (" << project.polluted_files.size() << "):\n";
            for (const auto& path : project.polluted_files) {
                out_ << "    -> " << path.string() << "\n";
            }
        }
        out_ << "  Mean CCR                  : " << format_optional_percent(project.mean_ccr) << "\n";
        out_ << "  Max CCR                   : " << format_optional_percent(project.max_ccr) << "\n";
        if (project.unknown_ccr_files > 0) {
            out_ << "  Unknown CCR files         : " << project.unknown_ccr_files << "\n";
        }
        if (project.unparseable_files > 0) {
            out_ << "  Unparseable files         : "
                 << colorize(std::to_string(project.unparseable_files), colors::RED) << "\n";
        }
        out_ << "  Global TL                 : " << colorize_lag(project.global_technical_lag) << "\n";
        for (const auto& instance : project.tl_instances) {
            out_ << "    -> " << instance << "\n";
        }
        out_ << std::string(PROJECT_WIDTH, '-') << "\n";

        out_ << "  Project Verdict: [" << colorize(engine::verdict_label(project.is_failed),
                                                   project.is_failed ? colors::RED : colors::GREEN) << "]\n";
        if (project.is_failed) {
            out_ << "  Reasons: " << string_utils::join(project.reasons, "; ") << "\n";
            out_ << "  Z-TIER requires: max_cc < " << t.project_max_cc
                 << ", max_adf < " << format_threshold(t.adf_threshold)
                 << ", global_tl == LOW"
                 << ", max_ccr <= " << format_percent(t.ccr_threshold, 0)
                 << ", no unparseable files\n";
        }
        out_ << std::string(PROJECT_WIDTH, '=') << "\n";
    }

    void ReportPrinter::print_outcome(const AuditReport& report) const {
        out_ << "Result: " << colorize_outcome(report.is_failed());
        std::size_t failed_files = 0;
        for (const auto& file : report.files) {
            if (file.is_failed) ++failed_files;
        }
        out_ << " (" << failed_files << "/" << report.files.size() << " files failed, "
             << string_utils::format_duration(report.analysis_duration.count()) << ")\n";
    }

}  // namespace sts::cli
