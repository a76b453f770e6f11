//
// Created by gregorian-rayne on 10/11/26.
//

#ifndef STS_JSON_EXPORTER_HPP
#define STS_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief Machine-readable audit report.
 *
 * Schema (top level):
 * @code
 *     {
 *       "tool": "sts", "version": "2.2.0", "target": "...",
 *       "mode": "file" | "directory", "config_source": "...",
 *       "generated_at": "2026-10-11T08:00:00Z",
 *       "files": [ { "path": ..., "max_cc": int|null, ... } ],
 *       "project": { ... } | null,
 *       "exit_code": 0 | 1
 *     }
 * @endcode
 *
 * Unknown values (ccr without history, cc of an unparseable file) are
 * written as null, never as 0.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"
#include "sts/types.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace sts::exporters {

    struct ExportOptions {
        bool pretty_print = true;
        int indent = 2;
    };

    class JsonExporter {
    public:
        [[nodiscard]] nlohmann::json to_json(const AuditReport& report) const;

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const AuditReport& report,
            const ExportOptions& options = {}
        ) const;

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const AuditReport& report,
            const ExportOptions& options = {}
        ) const;

        /**
         * Writes the report. The path must have passed validate_output_path.
         */
        [[nodiscard]] Result<void, Error> export_to_file(
            const fs::path& path,
            const AuditReport& report,
            const ExportOptions& options = {}
        ) const;
    };

    /**
     * Rejects output paths that would land inside the scanned directory or
     * overwrite the audited file.
     */
    [[nodiscard]] Result<void, Error> validate_output_path(const fs::path& output, const AuditReport& report);

    /**
     * Formats a timestamp as ISO 8601 UTC ("2026-10-11T08:00:00Z").
     */
    std::string format_timestamp(Timestamp ts);

}  // namespace sts::exporters

#endif //STS_JSON_EXPORTER_HPP
