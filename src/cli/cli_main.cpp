// cli_main.cpp
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "connectfour/cli/cli_runner.h"
#include "connectfour/cli/command_parser.h"
#include "connectfour/core/errors.h"

using namespace connectfour;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::parseOptions(cli::CommandParser::toArgs(argc, argv));
    } catch (const core::GameConstructionError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << cli::usage();
        return 1;
    }

    if (options.showHelp) {
        std::cout << cli::usage();
        return 0;
    }

    spdlog::set_level(spdlog::level::from_str(options.config.logLevel));

    try {
        return cli::runGame(options, std::cout);
    } catch (const core::GameConstructionError& e) {
        spdlog::error("CLI: invalid game setup: {}", e.what());
        std::cerr << e.what() << std::endl;
    } catch (const core::GameStateException& e) {
        spdlog::error("CLI: game halted: {}", e.what());
        std::cerr << e.what() << std::endl;
    }
    return 1;
}
