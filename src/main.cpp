#include <iostream>
#include <vector>
#include <string>
#include "cli/logtap_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        auto opts = parse_args(args);
        if (opts.is_err()) {
            std::cerr << theme::fail(opts.error);
            LogtapCLI::print_usage(std::cerr);
            return 1;
        }

        LogtapCLI cli(opts.value);
        return cli.run();
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
