#include <iostream>
#include <vector>
#include <string>
#include "cli/bugrep_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        auto opts = parse_cli_args(args);
        if (opts.is_err()) {
            std::cerr << theme::fail(opts.error);
            std::cerr << theme::step("Run 'bugrep --help' for usage");
            return 1;
        }

        BugrepCLI cli;
        return cli.run(opts.value);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
