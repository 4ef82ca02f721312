#include <iostream>
#include <vector>
#include <string>
#include "cli/monitor_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/types.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::CYAN << "    hpsmon"
              << theme::color::RESET << theme::color::DIM
              << "                        Prompt, send, follow the log, repeat" << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    hpsmon send "
              << theme::color::RESET << theme::color::AMBER << "<command>"
              << theme::color::RESET << theme::color::DIM
              << "      Send one command and follow its log" << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    hpsmon exec "
              << theme::color::RESET << theme::color::AMBER << "<command>"
              << theme::color::RESET << theme::color::DIM
              << "      Send one command and print its result" << theme::color::RESET << "\n";
    std::cout << theme::color::CYAN << "    hpsmon init-config"
              << theme::color::RESET << theme::color::DIM
              << "            Write ~/.hps_cli/monitor.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>               Use another config file\n"
              << "    --version                     Show version\n"
              << "    --help                        Show this help"
              << theme::color::RESET << "\n\n";
}

static std::string join_args(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); i++) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args;
        std::string config_path;
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("--config needs a path.");
                    return EXIT_GENERIC;
                }
                config_path = argv[++i];
            } else {
                args.push_back(a);
            }
        }

        std::string cmd = args.empty() ? "" : args[0];

        if (cmd == "--version") {
            std::cout << theme::color::CYAN << theme::color::BOLD << "hpsmon"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return EXIT_OK;
        } else if (cmd == "--help") {
            print_usage();
            return EXIT_OK;
        } else if (cmd == "init-config") {
            auto created = create_default_monitor_config();
            if (created.is_err()) {
                std::cout << theme::fail(created.error);
                return exit_code_for(created.code);
            }
            std::cout << theme::ok("Config at " + get_monitor_config_path().string());
            return EXIT_OK;
        }

        auto config = config_path.empty() ? Config::load() : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return exit_code_for(config.code);
        }

        MonitorCLI cli(config.value);

        if (cmd.empty()) {
            return cli.run_loop();
        } else if (cmd == "send") {
            return cli.run_send(join_args(args, 1));
        } else if (cmd == "exec") {
            return cli.run_exec(join_args(args, 1));
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_GENERIC;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_GENERIC;
    }
}
