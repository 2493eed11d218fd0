// board.cpp
#include "connectfour/core/board.h"
#include "connectfour/core/errors.h"
#include <algorithm>
#include <string>

namespace connectfour {
namespace core {

namespace {
constexpr int NUM_FAMILIES = 4;

// Start offsets that leave room for LINE_LENGTH cells
int spanStarts(int extent) {
    return std::max(0, extent - (LINE_LENGTH - 1));
}
} // namespace

LineGenerator::LineGenerator(int rows, int columns)
    : rows_(rows),
      columns_(columns),
      family_(0),
      row_(0),
      column_(0),
      lastDirection_(LineDirection::HORIZONTAL) {
}

LineGenerator::FamilyRange LineGenerator::rangeFor(int family) const {
    switch (family) {
        case 0:  // horizontal
            return {rows_, 0, spanStarts(columns_), 1};
        case 1:  // vertical
            return {spanStarts(rows_), 0, columns_, columns_};
        case 2:  // down-right
            return {spanStarts(rows_), 0, spanStarts(columns_), columns_ + 1};
        default: // down-left, starts from the rightmost cell of the line
            return {spanStarts(rows_), LINE_LENGTH - 1, columns_, columns_ - 1};
    }
}

std::optional<Line> LineGenerator::next() {
    while (family_ < NUM_FAMILIES) {
        FamilyRange range = rangeFor(family_);

        if (row_ < range.rowEnd && column_ >= range.columnBegin && column_ < range.columnEnd) {
            Line line;
            int start = row_ * columns_ + column_;
            for (int i = 0; i < LINE_LENGTH; ++i) {
                line[i] = start + i * range.stride;
            }
            lastDirection_ = static_cast<LineDirection>(family_);

            if (++column_ >= range.columnEnd) {
                column_ = range.columnBegin;
                ++row_;
            }
            return line;
        }

        // Family exhausted (or empty on this board), move to the next one
        ++family_;
        row_ = 0;
        if (family_ < NUM_FAMILIES) {
            column_ = rangeFor(family_).columnBegin;
        }
    }

    return std::nullopt;
}

Board::Board(int rows, int columns)
    : rows_(rows), columns_(columns) {
    if (rows <= 0 || columns <= 0) {
        throw GameConstructionError(
            "Board dimensions must be strictly positive, got " +
            std::to_string(rows) + "x" + std::to_string(columns));
    }
    cells_.assign(static_cast<size_t>(rows) * static_cast<size_t>(columns), EMPTY_CELL);
}

int Board::index(int row, int column) const {
    if (row < 0 || row >= rows_ || column < 0 || column >= columns_) {
        throw GameStateException(
            "Cell (" + std::to_string(row) + ", " + std::to_string(column) +
            ") lies outside the " + std::to_string(rows_) + "x" +
            std::to_string(columns_) + " board");
    }
    return row * columns_ + column;
}

InternalId Board::atIndex(int index) const {
    if (index < 0 || index >= getCellCount()) {
        throw GameStateException("Cell index " + std::to_string(index) + " lies outside the board");
    }
    return cells_[index];
}

bool Board::hasEmptyCell() const {
    return std::find(cells_.begin(), cells_.end(), EMPTY_CELL) != cells_.end();
}

int Board::countOccupied() const {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
        [](InternalId cell) { return cell != EMPTY_CELL; }));
}

int Board::lineCount(int rows, int columns) {
    if (rows <= 0 || columns <= 0) {
        return 0;
    }
    int rowStarts = spanStarts(rows);
    int columnStarts = spanStarts(columns);
    return rows * columnStarts          // horizontal
         + rowStarts * columns          // vertical
         + 2 * rowStarts * columnStarts; // both diagonals
}

} // namespace core
} // namespace connectfour
