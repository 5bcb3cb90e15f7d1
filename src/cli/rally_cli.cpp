#include "rally_cli.hpp"
#include "theme.hpp"
#include <platform/terminal.hpp>
#include <iostream>

constexpr const char* RALLY_VERSION = "0.4.0";

RallyCLI::RallyCLI() {
    register_all_commands();
}

void RallyCLI::register_all_commands() {
    register_setup_commands(*this);
    register_log_commands(*this);
    register_run_commands(*this);
}

void RallyCLI::print_usage() const {
    std::cerr << "\n" << theme::brown(theme::bold("  rally"))
              << theme::dim("  drive an assistant CLI and keep the conversation log") << "\n";
    std::cerr << theme::section("Usage");
    std::cerr << theme::kv("rally <command> [options]", "");
    print_help();
    std::cerr << theme::section("Examples");
    std::cerr << theme::dim("    rally init-log --topic \"rust-features\" --purpose \"survey\"") << "\n"
              << theme::dim("    rally run --mode question --update-log --log <path> \"question\"") << "\n"
              << theme::dim("    rally run --mode review --cd ./src --search --log <path> \"question\"") << "\n"
              << theme::dim("    rally continue --log <path> \"follow-up\"") << "\n\n";
    std::cerr << theme::dim("    --search runs an interactive session with web search (not with --mode modify).") << "\n"
              << theme::dim("    RALLY_LOGS_DIR overrides logs_dir from ~/.rally/config.yaml.") << "\n\n";
}

int RallyCLI::run(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0] == "--help" || argv[0] == "-h" || argv[0] == "help") {
        print_usage();
        return EXIT_OK;
    }
    if (argv[0] == "--version") {
        std::cout << "rally version " << RALLY_VERSION << "\n";
        return EXIT_OK;
    }

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    int code = execute_command(argv[0], args);

    if (platform::interrupted() && code != EXIT_INTERRUPTED) {
        code = EXIT_INTERRUPTED;
    }
    return code;
}
