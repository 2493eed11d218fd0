// command_parser.h
#ifndef CONNECTFOUR_COMMAND_PARSER_H
#define CONNECTFOUR_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <map>

namespace connectfour {
namespace cli {

/**
 * @brief Helpers for turning command-line arguments into typed settings
 */
class CommandParser {
public:
    /**
     * @brief Collect argv[1..argc) into a vector
     */
    static std::vector<std::string> toArgs(int argc, const char* const argv[]);

    /**
     * @brief Extract flags from arguments
     *
     * Accepts "--flag value", "--flag=value" and bare "--flag". Extracted
     * flags (and their values) are removed from args, leaving positionals.
     *
     * @param args Vector of arguments
     * @param flagPrefix Prefix for flags
     * @return Map of flags to values (empty string for bare flags)
     */
    static std::map<std::string, std::string> extractFlags(
        std::vector<std::string>& args, const std::string& flagPrefix = "--");

    static bool hasFlag(const std::map<std::string, std::string>& flags, const std::string& flag);

    static std::string getFlagValue(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        const std::string& defaultValue = "");

    /**
     * @brief Get flag value as int
     *
     * @return Flag value, or defaultValue if the flag is absent
     * @throws GameConstructionError if the value is not an integer
     */
    static int getFlagValueInt(
        const std::map<std::string, std::string>& flags,
        const std::string& flag,
        int defaultValue = 0);

    /**
     * @brief Split a comma-separated value, trimming blanks around items
     */
    static std::vector<std::string> splitList(const std::string& value, char separator = ',');
};

} // namespace cli
} // namespace connectfour

#endif // CONNECTFOUR_COMMAND_PARSER_H
