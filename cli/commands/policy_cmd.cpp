//
// Created by gregorian-rayne on 10/12/26.
//

#include "sts/cli/commands/command.hpp"

#include "sts/policy/policy.hpp"
#include "sts/types.hpp"

#include <iostream>

namespace sts::cli
{
    /**
     * Policy command - prints the effective policy for a target as TOML.
     */
    class PolicyCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "policy";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the effective policy that an audit of <path> would use";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sts policy [OPTIONS] <path>\n"
                   "\n"
                   "Examples:\n"
                   "  sts policy src/\n"
                   "  sts policy --config ci/strict.sts.toml src/ > .sts.toml";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"config", 'c', "Policy file (skips the .sts.toml search)", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one target path";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return exit_codes::Pass;
            }

            apply_common_options(args);

            const fs::path target = args.positional().empty() ? fs::path(".") : fs::path(args.positional().front());
            std::optional<fs::path> config;
            if (auto path = args.get("config")) {
                config = fs::path(*path);
            }

            if (std::error_code ec; !config && !fs::exists(target, ec)) {
                print_error("Target not found: " + target.string());
                return exit_codes::OperationalError;
            }

            auto loaded = policy::resolve(target, config);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return exit_codes::OperationalError;
            }

            for (const auto& warning : loaded.value().warnings) {
                print_warning(warning);
            }
            print_verbose("Policy source: " + loaded.value().config.source);

            // The document is the command's output, so -q does not suppress it
            std::cout << loaded.value().config.to_toml();
            return exit_codes::Pass;
        }
    };

    namespace {
        struct PolicyCommandRegistrar {
            PolicyCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<PolicyCommand>()
                );
            }
        } policy_registrar;
    }
}  // namespace sts::cli
