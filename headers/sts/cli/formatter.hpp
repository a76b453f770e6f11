//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef STS_FORMATTER_HPP
#define STS_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal rendering of audit reports.
 *
 * Provides:
 * - ANSI colors (only when stdout is a terminal)
 * - Aligned tables
 * - The per-file table, single-file detail block and project summary
 */

#include "sts/types.hpp"
#include "sts/policy/policy.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sts::cli
{
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used: not disabled and stdout
         * is a terminal.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        bool show_headers_ = true;
    };

    /**
     * Formats a file path for display, truncating from the front with "...".
     */
    [[nodiscard]] std::string format_path(const fs::path& path, std::size_t max_width = 40);

    /**
     * Formats a ratio (0.3) as a percentage ("30.00%").
     */
    [[nodiscard]] std::string format_percent(double ratio, int precision = 2);

    /**
     * Formats an optional ratio, "n/a" when unknown.
     */
    [[nodiscard]] std::string format_optional_percent(const std::optional<double>& ratio);

    /**
     * Wraps text in a color when colors are enabled.
     */
    [[nodiscard]] std::string colorize(std::string_view text, const char* color);

    /**
     * Returns "PASS" or "FAIL", colored.
     */
    [[nodiscard]] std::string colorize_outcome(bool failed);

    /**
     * Prints audit reports to a stream.
     */
    class ReportPrinter {
    public:
        ReportPrinter(std::ostream& out, const policy::PolicyConfig& policy);

        /**
         * Prints the full terminal report for the report's mode.
         */
        void print_report(const AuditReport& report) const;

        void print_file_table(const std::vector<FileVerdict>& files) const;

        /**
         * Detailed block for single-file mode.
         */
        void print_file_detail(const FileVerdict& verdict) const;

        void print_project_summary(const ProjectVerdict& project) const;

        /**
         * Final "Result: PASS|FAIL" line.
         */
        void print_outcome(const AuditReport& report) const;

    private:
        void print_section(std::string_view title) const;

        std::ostream& out_;
        const policy::PolicyConfig& policy_;
    };

}  // namespace sts::cli

#endif //STS_FORMATTER_HPP
