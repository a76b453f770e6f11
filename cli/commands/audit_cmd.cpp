//
// Created by gregorian-rayne on 10/12/26.
//

#include "sts/cli/commands/command.hpp"
#include "sts/cli/formatter.hpp"

#include "sts/engine/audit_engine.hpp"
#include "sts/exporters/json_exporter.hpp"

#include <iostream>

namespace sts::cli
{
    /**
     * Audit command - measures a Python file or tree and reports the verdict.
     */
    class AuditCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "audit";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Audit a Python file or directory against the architectural policy";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sts audit [OPTIONS] <path>\n"
                   "\n"
                   "Exit status: 0 pass, 1 fail, 2 operational error, 130 interrupted\n"
                   "\n"
                   "Examples:\n"
                   "  sts audit src/\n"
                   "  sts audit --output ../report.json src/\n"
                   "  sts audit --no-churn -j 4 service.py";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Write the JSON report to FILE", false, true, "", "FILE"},
                {"config", 'c', "Policy file (skips the .sts.toml search)", false, true, "", "FILE"},
                {"jobs", 'j', "Worker threads (0 = hardware concurrency)", false, true, "0", "N"},
                {"no-churn", 0, "Skip git history (ccr unknown for every file)", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No target specified. Use 'sts audit <path>'";
            }
            if (args.positional().size() > 1) {
                return "Expected exactly one target path";
            }
            if (const auto jobs = args.get_int("jobs"); !jobs || *jobs < 0) {
                return "Invalid value for --jobs: " + args.get_or("jobs", "");
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return exit_codes::Pass;
            }

            apply_common_options(args);

            engine::AuditOptions options;
            options.target = args.positional().front();
            if (auto config = args.get("config")) {
                options.config_path = fs::path(*config);
            }
            options.jobs = static_cast<unsigned int>(args.get_int("jobs").value_or(0));
            options.churn_enabled = !args.get_flag("no-churn");
            options.cancelled = &interrupt_flag();

            print_verbose("Auditing " + options.target.string());

            auto result = engine::run_audit(options);
            if (result.is_err()) {
                if (result.error().code() == ErrorCode::Cancelled) {
                    print_error("interrupted");
                    return exit_codes::Interrupted;
                }
                print_error(result.error().to_string());
                return exit_codes::OperationalError;
            }

            const auto& run = result.value();
            const auto& report = run.report;

            for (const auto& warning : run.warnings) {
                print_warning(warning);
            }

            print_verbose("Policy: " + report.config_source);
            print_verbose("Files: " + std::to_string(report.files.size()));
            for (const auto& file : report.files) {
                const auto& m = file.metrics;
                if (m.analysis_error) {
                    print_verbose(m.path.string() + ": " + *m.analysis_error);
                }
                if (!m.ccr) {
                    print_debug(m.path.string() + ": ccr unknown (" + m.churn_note + ")");
                } else if (m.churn_touches) {
                    print_debug(m.path.string() + ": " + std::to_string(*m.churn_touches) + " commits in window");
                }
            }

            const auto output = args.get("output");
            if (output) {
                if (auto valid = exporters::validate_output_path(*output, report); valid.is_err()) {
                    print_error(valid.error().to_string());
                    return exit_codes::OperationalError;
                }
            }

            const exporters::JsonExporter exporter;

            if (is_json()) {
                if (auto written = exporter.export_to_stream(std::cout, report); written.is_err()) {
                    print_error(written.error().to_string());
                    return exit_codes::OperationalError;
                }
            } else if (!is_quiet()) {
                const ReportPrinter printer(std::cout, run.policy);
                printer.print_report(report);
            }

            if (output) {
                if (auto written = exporter.export_to_file(*output, report); written.is_err()) {
                    print_error(written.error().to_string());
                    return exit_codes::OperationalError;
                }
                if (is_json()) {
                    print_verbose("JSON written to " + *output);
                } else {
                    print("\nJSON written to " + *output);
                }
            }

            return report.exit_code();
        }
    };

    namespace {
        struct AuditCommandRegistrar {
            AuditCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AuditCommand>()
                );
            }
        } audit_registrar;
    }
}  // namespace sts::cli
