//
// Created by gregorian-rayne on 10/12/26.
//

#include "sts/cli/commands/command.hpp"
#include "sts/types.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

namespace {

    void handle_interrupt(int /*signal*/) {
        sts::cli::interrupt_flag().store(true);
    }

    void install_signal_handlers() {
        struct sigaction action{};
        action.sa_handler = handle_interrupt;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace sts::cli;

    install_signal_handlers();

    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string command_name = "help";
        if (!args.empty()) {
            if (args.front() == "-h" || args.front() == "--help") {
                args.erase(args.begin());
            } else if (args.front() == "--version") {
                command_name = "version";
                args.erase(args.begin());
            } else {
                command_name = args.front();
                args.erase(args.begin());
            }
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: Unknown command: " << command_name << "\n";
            std::cerr << "Run 'sts help' for a list of commands.\n";
            return sts::exit_codes::OperationalError;
        }

        auto parsed = parse_arguments(args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return sts::exit_codes::OperationalError;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = command->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                std::cerr << command->usage() << "\n";
                return sts::exit_codes::OperationalError;
            }
        }

        const int code = command->execute(parsed.args);
        if (interrupt_flag().load()) {
            return sts::exit_codes::Interrupted;
        }
        return code;

    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return sts::exit_codes::OperationalError;
    }
}
