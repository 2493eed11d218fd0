// state_view.cpp
#include "connectfour/core/state_view.h"
#include "connectfour/core/errors.h"
#include <sstream>
#include <utility>

namespace connectfour {
namespace core {

StateView::StateView(BoardSize size, std::vector<std::optional<Token>> board)
    : size_(size), board_(std::move(board)) {
    if (size_.rows <= 0 || size_.columns <= 0 ||
        board_.size() != static_cast<size_t>(size_.rows) * static_cast<size_t>(size_.columns)) {
        throw GameStateException("State view does not match its board size");
    }
}

const std::optional<Token>& StateView::at(int row, int column) const {
    if (row < 0 || row >= size_.rows || column < 0 || column >= size_.columns) {
        throw GameStateException(
            "Cell (" + std::to_string(row) + ", " + std::to_string(column) + ") lies outside the board");
    }
    return board_[row * size_.columns + column];
}

std::vector<int> StateView::openColumns() const {
    std::vector<int> open;
    for (int column = 0; column < size_.columns; ++column) {
        if (!board_[column]) {
            open.push_back(column + 1);
        }
    }
    return open;
}

std::string StateView::toString() const {
    std::ostringstream ss;
    for (int row = 0; row < size_.rows; ++row) {
        ss << '[';
        for (int column = 0; column < size_.columns; ++column) {
            if (column > 0) {
                ss << ',';
            }
            const auto& cell = board_[row * size_.columns + column];
            ss << (cell && !cell->empty() ? cell->front() : ' ');
        }
        ss << ']';
        if (row + 1 < size_.rows) {
            ss << '\n';
        }
    }
    return ss.str();
}

} // namespace core
} // namespace connectfour
