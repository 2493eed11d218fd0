// game_config.h
#ifndef CONNECTFOUR_GAME_CONFIG_H
#define CONNECTFOUR_GAME_CONFIG_H

#include <string>
#include <cstdint>

#include "connectfour/types.h"

namespace connectfour {
namespace core {

/**
 * @brief Settings of a game
 *
 * JSON keys: "rows", "columns", "seed", "max_invalid_attempts",
 * "log_level". Keys missing from the JSON keep their defaults.
 */
struct GameConfig {
    int rows = 6;
    int columns = 7;
    uint32_t seed = 0;            // 0 seeds from the clock
    int maxInvalidAttempts = 3;   // consecutive full-column attempts before forfeit
    std::string logLevel = "info";

    BoardSize getBoardSize() const { return BoardSize{rows, columns}; }

    /**
     * @throws GameConstructionError for non-positive dimensions or retry bound,
     *         or an unknown log level
     */
    void validate() const;

    std::string toJson() const;

    /**
     * @throws GameConstructionError on malformed JSON or wrongly typed values
     */
    static GameConfig fromJson(const std::string& json);

    /**
     * @throws GameConstructionError if the file cannot be read or parsed
     */
    static GameConfig loadFromFile(const std::string& filename);
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_GAME_CONFIG_H
