//
// Created by gregorian-rayne on 10/12/26.
//

#include "sts/cli/commands/command.hpp"

#include "sts/types.hpp"
#include "sts/version.hpp"

#include <algorithm>
#include <iostream>

namespace sts::cli
{
    class VersionCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "version";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Print the version";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return exit_codes::Pass;
            }
            std::cout << PROJECT_SHORT_NAME << " " << VERSION_STRING << " (" << PROJECT_NAME << ")\n";
            return exit_codes::Pass;
        }
    };

    /**
     * Help command - lists commands, or shows one command's help.
     */
    class HelpCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "help";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show help for a command";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sts help [command]";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (!args.positional().empty()) {
                const auto& topic = args.positional().front();
                if (const Command* cmd = CommandRegistry::instance().find(topic)) {
                    cmd->print_help();
                    return exit_codes::Pass;
                }
                print_error("Unknown command: " + topic);
                return exit_codes::OperationalError;
            }

            std::cout << PROJECT_NAME << " " << VERSION_STRING << "\n\n";
            std::cout << "Usage: " << PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
            std::cout << "Commands:\n";
            auto commands = CommandRegistry::instance().list();
            std::ranges::sort(commands, {}, &Command::name);
            for (const Command* cmd : commands) {
                std::cout << "  " << cmd->name();
                for (std::size_t pad = cmd->name().size(); pad < 10; ++pad) {
                    std::cout << ' ';
                }
                std::cout << cmd->description() << "\n";
            }
            std::cout << "\nRun 'sts help <command>' for command options.\n";
            return exit_codes::Pass;
        }
    };

    namespace {
        struct VersionCommandRegistrar {
            VersionCommandRegistrar() {
                CommandRegistry::instance().register_command(std::make_unique<VersionCommand>());
                CommandRegistry::instance().register_command(std::make_unique<HelpCommand>());
            }
        } version_registrar;
    }
}  // namespace sts::cli
