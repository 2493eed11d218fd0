// cli_runner.h
#ifndef CONNECTFOUR_CLI_RUNNER_H
#define CONNECTFOUR_CLI_RUNNER_H

#include <string>
#include <vector>
#include <memory>
#include <ostream>

#include "connectfour/types.h"
#include "connectfour/core/game_config.h"
#include "connectfour/agents/agent.h"

namespace connectfour {
namespace cli {

/**
 * @brief Settings of one command-line run
 */
struct CliOptions {
    core::GameConfig config;
    std::vector<core::Token> players{"X", "O"};
    std::vector<std::string> agentKinds{"human", "random"};
    std::string recordPath;   // empty: do not save the outcome
    bool showHelp = false;
};

/**
 * @brief Build options from command-line arguments
 *
 * A --config file is read first; the remaining flags override its values.
 *
 * @param args Arguments without the program name
 * @throws GameConstructionError on unknown flags, bad values or a
 *         players/agents count mismatch
 */
CliOptions parseOptions(const std::vector<std::string>& args);

/**
 * @brief Create one agent per player
 *
 * "human" creates a CLIAgent, "random" a RandomAgent seeded from the
 * configuration seed (offset per player so agents differ).
 *
 * @throws GameConstructionError for an unknown agent kind
 */
std::vector<std::shared_ptr<agents::Agent>> createAgents(const CliOptions& options);

/**
 * @brief Play one game and print the outcome
 *
 * @return Process exit code
 */
int runGame(const CliOptions& options, std::ostream& out);

std::string usage();

} // namespace cli
} // namespace connectfour

#endif // CONNECTFOUR_CLI_RUNNER_H
