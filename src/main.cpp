#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/hub_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(CHANHUB_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    chanhub start "
              << theme::color::RESET << theme::color::BROWN << "[-D]"
              << theme::color::RESET << theme::color::DIM
              << "       Run in foreground, or as a daemon" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub stop"
              << theme::color::RESET << theme::color::DIM
              << "             Stop the running daemon" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub restart"
              << theme::color::RESET << theme::color::DIM
              << "          Stop, then start as a daemon" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub status"
              << theme::color::RESET << theme::color::DIM
              << "           Show service and channel status" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub validate "
              << theme::color::RESET << theme::color::BROWN << "[path]"
              << theme::color::RESET << theme::color::DIM
              << "  Check a configuration file" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub generate "
              << theme::color::RESET << theme::color::BROWN << "[-s file] [-o file]"
              << theme::color::RESET << theme::color::DIM
              << "  Hosts from ~/.ssh/config" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    chanhub test"
              << theme::color::RESET << theme::color::DIM
              << "             Probe local forward ports" << theme::color::RESET << "\n";
    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    -c, --config <path>   Configuration file\n"
              << "    -d, --debug           Debug logging\n"
              << "    --log <path>          Log file\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        auto parsed = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (parsed.is_err()) {
            std::cout << theme::fail(parsed.error);
            print_usage();
            return 1;
        }

        CommandLine& cl = parsed.value;
        if (cl.version) {
            std::cout << theme::color::BLUE << theme::color::BOLD << "chanhub"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << CHANHUB_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (cl.help) {
            print_usage();
            return 0;
        }
        if (cl.command.empty()) {
            print_usage();
            return 1;
        }

        CliOptions options = cl.options;
        options.argv0 = argc > 0 ? argv[0] : "chanhub";
        const std::string& cmd = cl.command;
        const std::vector<std::string>& rest = cl.args;

        HubCLI cli(options);

        if (cmd == "start") {
            bool daemon = false;
            for (const auto& r : rest) {
                if (r == "-D" || r == "--daemon") daemon = true;
            }
            return cli.run_start(daemon);
        } else if (cmd == "stop") {
            return cli.run_stop();
        } else if (cmd == "restart") {
            return cli.run_restart();
        } else if (cmd == "status") {
            return cli.run_status();
        } else if (cmd == "validate") {
            return cli.run_validate(rest.empty() ? "" : rest[0]);
        } else if (cmd == "generate") {
            std::string ssh_config, output;
            for (size_t i = 0; i < rest.size(); i++) {
                if ((rest[i] == "-s" || rest[i] == "--ssh-config") && i + 1 < rest.size()) {
                    ssh_config = rest[++i];
                } else if ((rest[i] == "-o" || rest[i] == "--output") && i + 1 < rest.size()) {
                    output = rest[++i];
                }
            }
            return cli.run_generate(ssh_config, output);
        } else if (cmd == "test") {
            return cli.run_test();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
