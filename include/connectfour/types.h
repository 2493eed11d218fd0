// types.h
#ifndef CONNECTFOUR_TYPES_H
#define CONNECTFOUR_TYPES_H

#include <cstdint>
#include <string>

namespace connectfour {
namespace core {

// External identifier of an agent's pieces, supplied by the caller
using Token = std::string;

// Compact per-game id a token is stored as on the board
using InternalId = std::uint8_t;

// Board value of a cell holding no piece
constexpr InternalId EMPTY_CELL = 0;

// Number of tokens that fit in the internal id range
constexpr int MAX_TOKENS = 255;

/**
 * @brief Board dimensions, rows first
 */
struct BoardSize {
    int rows = 6;
    int columns = 7;

    bool operator==(const BoardSize& other) const {
        return rows == other.rows && columns == other.columns;
    }
    bool operator!=(const BoardSize& other) const { return !(*this == other); }
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_TYPES_H
