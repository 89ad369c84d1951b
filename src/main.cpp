#include <iostream>
#include <vector>
#include <string>
#include "cli/azprov_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        if (!args.empty() && args[0] == "--version") {
            std::cout << theme::color::SLATE << theme::color::BOLD << "azprov"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << AZPROV_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        AzprovCLI cli(config.value);
        if (args.empty() || args[0] == "--help" || args[0] == "help") {
            cli.print_usage();
            return args.empty() ? 1 : 0;
        }

        std::string cmd = args[0];
        args.erase(args.begin());
        return cli.execute(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
