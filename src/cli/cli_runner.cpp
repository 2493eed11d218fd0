// cli_runner.cpp
#include "connectfour/cli/cli_runner.h"
#include "connectfour/cli/command_parser.h"
#include "connectfour/core/errors.h"
#include "connectfour/agents/cli_agent.h"
#include "connectfour/agents/random_agent.h"
#include "connectfour/game/game.h"
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace connectfour {
namespace cli {

namespace {
const std::set<std::string> KNOWN_FLAGS = {
    "config", "rows", "columns", "players", "agents",
    "seed", "max-retries", "log-level", "record", "help"
};
} // namespace

CliOptions parseOptions(const std::vector<std::string>& args) {
    std::vector<std::string> remaining = args;
    auto flags = CommandParser::extractFlags(remaining);

    // -h is the only short form
    for (auto it = remaining.begin(); it != remaining.end(); ) {
        if (*it == "-h") {
            flags["help"] = "";
            it = remaining.erase(it);
        } else {
            ++it;
        }
    }

    if (!remaining.empty()) {
        throw core::GameConstructionError("Unexpected argument: " + remaining.front());
    }
    for (const auto& flag : flags) {
        if (KNOWN_FLAGS.count(flag.first) == 0) {
            throw core::GameConstructionError("Unknown option: --" + flag.first);
        }
    }

    CliOptions options;
    options.showHelp = CommandParser::hasFlag(flags, "help");
    if (options.showHelp) {
        return options;
    }

    if (CommandParser::hasFlag(flags, "config")) {
        options.config = core::GameConfig::loadFromFile(CommandParser::getFlagValue(flags, "config"));
    }

    core::GameConfig& config = options.config;
    config.rows = CommandParser::getFlagValueInt(flags, "rows", config.rows);
    config.columns = CommandParser::getFlagValueInt(flags, "columns", config.columns);
    config.maxInvalidAttempts = CommandParser::getFlagValueInt(flags, "max-retries", config.maxInvalidAttempts);
    int seed = CommandParser::getFlagValueInt(flags, "seed", static_cast<int>(config.seed));
    if (seed < 0) {
        throw core::GameConstructionError("--seed must not be negative");
    }
    config.seed = static_cast<uint32_t>(seed);
    config.logLevel = CommandParser::getFlagValue(flags, "log-level", config.logLevel);
    config.validate();

    if (CommandParser::hasFlag(flags, "players")) {
        options.players = CommandParser::splitList(CommandParser::getFlagValue(flags, "players"));
    }
    if (CommandParser::hasFlag(flags, "agents")) {
        options.agentKinds = CommandParser::splitList(CommandParser::getFlagValue(flags, "agents"));
    }
    if (options.players.size() != options.agentKinds.size()) {
        throw core::GameConstructionError(
            "--players lists " + std::to_string(options.players.size()) + " tokens but --agents lists " +
            std::to_string(options.agentKinds.size()) + " kinds");
    }

    options.recordPath = CommandParser::getFlagValue(flags, "record");
    return options;
}

std::vector<std::shared_ptr<agents::Agent>> createAgents(const CliOptions& options) {
    std::vector<std::shared_ptr<agents::Agent>> result;

    for (size_t i = 0; i < options.players.size(); ++i) {
        const std::string& kind = options.agentKinds[i];

        if (kind == "human") {
            result.push_back(std::make_shared<agents::CLIAgent>(options.players[i]));
        } else if (kind == "random") {
            unsigned int seed = options.config.seed == 0
                ? 0u
                : options.config.seed + static_cast<unsigned int>(i) + 1;
            result.push_back(std::make_shared<agents::RandomAgent>(options.players[i], seed));
        } else {
            throw core::GameConstructionError("Unknown agent kind: " + kind + " (expected human or random)");
        }
    }

    return result;
}

int runGame(const CliOptions& options, std::ostream& out) {
    game::Game game(createAgents(options), options.config);
    core::Outcome outcome = game.play();

    out << outcome.toString() << std::endl;

    if (!options.recordPath.empty()) {
        if (!outcome.saveToFile(options.recordPath)) {
            spdlog::error("CLI: could not write outcome to {}", options.recordPath);
            return 1;
        }
        spdlog::info("CLI: outcome written to {}", options.recordPath);
    }

    return 0;
}

std::string usage() {
    std::ostringstream ss;
    ss << "Usage: connectfour [options]\n"
       << "\n"
       << "Options:\n"
       << "  -h, --help                 Show this help message\n"
       << "  --config FILE              Read settings from a JSON file\n"
       << "  --rows N                   Number of board rows (default: 6)\n"
       << "  --columns N                Number of board columns (default: 7)\n"
       << "  --players X,O              Comma-separated player tokens\n"
       << "  --agents human,random      Agent kind per player (human, random)\n"
       << "  --seed N                   Random seed, 0 for a time-based seed\n"
       << "  --max-retries N            Full-column attempts before forfeit (default: 3)\n"
       << "  --log-level LEVEL          trace, debug, info, warn, error, off\n"
       << "  --record FILE              Save the outcome as JSON\n"
       << "\n"
       << "Examples:\n"
       << "  connectfour --agents random,random --seed 7     # Watch two random agents\n"
       << "  connectfour --rows 5 --columns 9 --record game.json\n";
    return ss.str();
}

} // namespace cli
} // namespace connectfour
