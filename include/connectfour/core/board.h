// board.h
#ifndef CONNECTFOUR_BOARD_H
#define CONNECTFOUR_BOARD_H

#include <array>
#include <vector>
#include <optional>

#include "connectfour/types.h"

namespace connectfour {
namespace core {

// Number of cells in a winning line
constexpr int LINE_LENGTH = 4;

// Flat cell indices of one line, in scan order
using Line = std::array<int, LINE_LENGTH>;

/**
 * @brief Direction families of lines, in the order they are scanned
 */
enum class LineDirection {
    HORIZONTAL,
    VERTICAL,
    DIAGONAL_DOWN_RIGHT, // top-left to bottom-right
    DIAGONAL_DOWN_LEFT   // top-right to bottom-left
};

/**
 * @brief Lazy enumeration of every line of a rows x columns board
 *
 * Lines come out family by family (horizontal, vertical, down-right,
 * down-left); inside a family the starting cell moves left to right, then
 * top to bottom. Every line is produced exactly once and only where it fits.
 */
class LineGenerator {
public:
    LineGenerator(int rows, int columns);

    /**
     * @brief Produce the next line
     *
     * @return The line, or empty once every line has been produced
     */
    std::optional<Line> next();

    /**
     * @brief Direction of the line most recently returned by next()
     */
    LineDirection lastDirection() const { return lastDirection_; }

private:
    struct FamilyRange {
        int rowEnd;
        int columnBegin;
        int columnEnd;
        int stride;
    };

    FamilyRange rangeFor(int family) const;

    int rows_;
    int columns_;
    int family_;
    int row_;
    int column_;
    LineDirection lastDirection_;
};

/**
 * @brief Fixed-size grid of internal ids stored row-major, top row first
 */
class Board {
public:
    /**
     * @brief Constructor
     *
     * @param rows Number of rows (> 0)
     * @param columns Number of columns (> 0)
     * @throws GameConstructionError for a non-positive dimension
     */
    Board(int rows, int columns);

    explicit Board(BoardSize size) : Board(size.rows, size.columns) {}

    int getRows() const { return rows_; }
    int getColumns() const { return columns_; }
    int getCellCount() const { return static_cast<int>(cells_.size()); }
    BoardSize getSize() const { return BoardSize{rows_, columns_}; }

    /**
     * @brief Flat index of a 0-based (row, column) pair
     *
     * @throws GameStateException if the cell lies outside the board
     */
    int index(int row, int column) const;

    InternalId at(int row, int column) const { return cells_[index(row, column)]; }
    InternalId atIndex(int index) const;
    void set(int row, int column, InternalId value) { cells_[index(row, column)] = value; }

    bool isEmpty(int row, int column) const { return at(row, column) == EMPTY_CELL; }
    bool hasEmptyCell() const;
    int countOccupied() const;

    const std::vector<InternalId>& cells() const { return cells_; }

    /**
     * @brief Start a fresh enumeration of this board's lines
     */
    LineGenerator lines() const { return LineGenerator(rows_, columns_); }

    /**
     * @brief Total number of lines on a rows x columns board
     */
    static int lineCount(int rows, int columns);

private:
    int rows_;
    int columns_;
    std::vector<InternalId> cells_;
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_BOARD_H
