#include <iostream>
#include <vector>
#include <string>
#include "cli/rally_cli.hpp"
#include "cli/theme.hpp"
#include <platform/terminal.hpp>

int main(int argc, char** argv) {
    theme::enabled() = platform::stderr_is_tty();
    platform::install_interrupt_handler();

    try {
        RallyCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_FATAL;
    }
}
