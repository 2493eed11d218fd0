// src/cli/command_parser.cpp
#include "connectfour/cli/command_parser.h"
#include "connectfour/core/errors.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace connectfour {
namespace cli {

namespace {
std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}
} // namespace

std::vector<std::string> CommandParser::toArgs(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::map<std::string, std::string> CommandParser::extractFlags(
    std::vector<std::string>& args, const std::string& flagPrefix) {

    std::map<std::string, std::string> flags;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.size() <= flagPrefix.size() || arg.compare(0, flagPrefix.size(), flagPrefix) != 0) {
            positionals.push_back(arg);
            continue;
        }

        std::string flag = arg.substr(flagPrefix.size());
        std::string value;

        size_t equalPos = flag.find('=');
        if (equalPos != std::string::npos) {
            value = flag.substr(equalPos + 1);
            flag = flag.substr(0, equalPos);
        } else if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
            // Next argument is not a flag, use it as value
            value = args[++i];
        }

        flags[flag] = value;
    }

    args = std::move(positionals);
    return flags;
}

bool CommandParser::hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag) {
    return flags.find(flag) != flags.end();
}

std::string CommandParser::getFlagValue(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    const std::string& defaultValue) {

    auto it = flags.find(flag);
    return it != flags.end() ? it->second : defaultValue;
}

int CommandParser::getFlagValueInt(
    const std::map<std::string, std::string>& flags,
    const std::string& flag,
    int defaultValue) {

    auto it = flags.find(flag);
    if (it == flags.end()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed == it->second.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw core::GameConstructionError("--" + flag + " expects an integer, got '" + it->second + "'");
}

std::vector<std::string> CommandParser::splitList(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;

    while (std::getline(iss, item, separator)) {
        items.push_back(trim(item));
    }
    return items;
}

} // namespace cli
} // namespace connectfour
