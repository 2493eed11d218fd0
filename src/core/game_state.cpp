// game_state.cpp
#include "connectfour/core/game_state.h"
#include "connectfour/core/errors.h"
#include <algorithm>
#include <string>
#include <utility>

namespace connectfour {
namespace core {

GameState::GameState(const std::vector<Token>& tokens, BoardSize size)
    : tokenMap_(tokens),
      board_(size) {
}

void GameState::checkColumn(int column) const {
    if (column < 1 || column > board_.getColumns()) {
        throw ActionError(
            "Cannot place a token in column " + std::to_string(column) +
            ". Columns are indexed from 1 to " + std::to_string(board_.getColumns()) + ".",
            column);
    }
}

void GameState::place(int column, const Token& token) {
    checkColumn(column);
    InternalId id = tokenMap_.toInternal(token);

    // Gravity: scan from the bottom row upward for the first empty cell
    for (int row = board_.getRows() - 1; row >= 0; --row) {
        if (board_.isEmpty(row, column - 1)) {
            board_.set(row, column - 1, id);
            return;
        }
    }

    throw ActionError(
        "Cannot place a token in column " + std::to_string(column) + ". Column is full.",
        column);
}

OutcomeCheck GameState::checkOutcome() const {
    OutcomeCheck result;
    const auto& cells = board_.cells();

    LineGenerator lines = board_.lines();
    while (auto line = lines.next()) {
        InternalId first = cells[(*line)[0]];
        if (first == EMPTY_CELL) {
            continue;
        }

        bool complete = std::all_of(line->begin() + 1, line->end(),
            [&](int index) { return cells[index] == first; });
        if (complete) {
            result.status = OutcomeStatus::WIN;
            result.winner = tokenMap_.toExternal(first);
            result.winningLine = *line;
            return result;
        }
    }

    if (!board_.hasEmptyCell()) {
        result.status = OutcomeStatus::DRAW;
    }
    return result;
}

StateView GameState::exposeView() const {
    std::vector<std::optional<Token>> cells;
    cells.reserve(board_.getCellCount());

    for (InternalId id : board_.cells()) {
        if (id == EMPTY_CELL) {
            cells.emplace_back(std::nullopt);
        } else {
            cells.emplace_back(tokenMap_.toExternal(id));
        }
    }

    return StateView(board_.getSize(), std::move(cells));
}

bool GameState::isColumnFull(int column) const {
    checkColumn(column);
    return !board_.isEmpty(0, column - 1);
}

std::vector<int> GameState::openColumns() const {
    std::vector<int> open;
    for (int column = 1; column <= board_.getColumns(); ++column) {
        if (!isColumnFull(column)) {
            open.push_back(column);
        }
    }
    return open;
}

std::string GameState::toString() const {
    return exposeView().toString();
}

} // namespace core
} // namespace connectfour
