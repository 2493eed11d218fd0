// game_state.h
#ifndef CONNECTFOUR_GAME_STATE_H
#define CONNECTFOUR_GAME_STATE_H

#include <vector>
#include <string>
#include <optional>

#include "connectfour/types.h"
#include "connectfour/core/board.h"
#include "connectfour/core/token_map.h"
#include "connectfour/core/state_view.h"

namespace connectfour {
namespace core {

/**
 * @brief Terminal status reported by the state
 */
enum class OutcomeStatus {
    UNFINISHED,
    WIN,
    DRAW
};

/**
 * @brief Result of checking the board for the end of the game
 */
struct OutcomeCheck {
    OutcomeStatus status = OutcomeStatus::UNFINISHED;
    std::optional<Token> winner;      // set for WIN only
    std::optional<Line> winningLine;  // set for WIN only

    bool isTerminal() const { return status != OutcomeStatus::UNFINISHED; }
};

/**
 * @brief Authoritative state of one game
 *
 * GameState is created by the orchestrator for a single game and is never
 * handed to an agent directly; agents receive StateView copies from
 * exposeView(). Pieces are stored as internal ids, and only place() writes
 * to the board.
 */
class GameState {
public:
    /**
     * @brief Constructor
     *
     * @param tokens External tokens of the participants
     * @param size Board dimensions
     * @throws GameConstructionError on invalid tokens or dimensions
     */
    explicit GameState(const std::vector<Token>& tokens, BoardSize size = BoardSize{});

    /**
     * @brief Drop a token into a column
     *
     * The token lands in the lowest empty cell of the column.
     *
     * @param column Column, indexed from 1
     * @param token Token of the acting agent
     * @throws ActionError if the column is full or outside the board
     * @throws GameStateException if the token is unknown
     */
    void place(int column, const Token& token);

    /**
     * @brief Scan the board for a win or a draw
     *
     * Lines are checked horizontal, vertical, down-right, down-left; the
     * first line of four identical pieces decides the winner. A full board
     * without such a line is a draw.
     */
    OutcomeCheck checkOutcome() const;

    /**
     * @brief Snapshot of the board with external tokens
     */
    StateView exposeView() const;

    /**
     * @throws ActionError if the column is outside the board
     */
    bool isColumnFull(int column) const;

    std::vector<int> openColumns() const;
    int countPieces() const { return board_.countOccupied(); }

    BoardSize getBoardSize() const { return board_.getSize(); }

    std::string toString() const;

private:
    TokenMap tokenMap_;
    Board board_;

    void checkColumn(int column) const;
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_GAME_STATE_H
