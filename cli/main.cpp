//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cli/commands/command.hpp"
#include "cie/version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(const int argc, char** argv) {
    using namespace cie::cli;

    try {
        if (argc < 2) {
            print_global_help();
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "help" || command_name == "--help" || command_name == "-h") {
            print_global_help();
            return 0;
        }
        if (command_name == "version" || command_name == "--version") {
            std::cout << "cie " << cie::VERSION_STRING << "\n";
            return 0;
        }

        Command* command = CommandRegistry::instance().find(command_name);
        if (command == nullptr) {
            std::cerr << "error: Unknown command: " << command_name << "\n\n";
            print_global_help();
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        auto parsed = parse_arguments(args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
