// state_view.h
#ifndef CONNECTFOUR_STATE_VIEW_H
#define CONNECTFOUR_STATE_VIEW_H

#include <vector>
#include <string>
#include <optional>

#include "connectfour/types.h"

namespace connectfour {
namespace core {

/**
 * @brief Read-only snapshot of the board handed to agents
 *
 * Cells hold the external token of the piece, or nothing for an empty
 * cell, row-major from the upper left to the lower right. A view is a
 * copy: nothing done with it reaches the authoritative state.
 */
class StateView {
public:
    /**
     * @brief Constructor
     *
     * @param size Board dimensions
     * @param board rows * columns cells, row-major
     * @throws GameStateException if the cell count does not match the size
     */
    StateView(BoardSize size, std::vector<std::optional<Token>> board);

    int getRows() const { return size_.rows; }
    int getColumns() const { return size_.columns; }
    BoardSize getBoardSize() const { return size_; }
    const std::vector<std::optional<Token>>& getBoard() const { return board_; }

    /**
     * @brief Cell content at a 0-based (row, column)
     *
     * @throws GameStateException if the cell lies outside the board
     */
    const std::optional<Token>& at(int row, int column) const;

    /**
     * @brief 1-based columns whose top cell is empty
     */
    std::vector<int> openColumns() const;

    /**
     * @brief One line per row, e.g. "[X, ,O]", using each token's first character
     */
    std::string toString() const;

private:
    BoardSize size_;
    std::vector<std::optional<Token>> board_;
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_STATE_VIEW_H
