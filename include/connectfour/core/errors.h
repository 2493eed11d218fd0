// errors.h
#ifndef CONNECTFOUR_ERRORS_H
#define CONNECTFOUR_ERRORS_H

#include <string>
#include <stdexcept>

namespace connectfour {
namespace core {

/**
 * @brief Exception for game state errors
 *
 * Raised when the engine itself is misused: unknown tokens, writes to a
 * finalized outcome, replaying a finished game.
 */
class GameStateException : public std::runtime_error {
public:
    explicit GameStateException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for state-dependent invalid actions
 *
 * Whether the action is legal can only be decided by looking at the
 * board, e.g. placing a token in a full column.
 */
class ActionError : public GameStateException {
public:
    ActionError(const std::string& message, int column)
        : GameStateException(message), column_(column) {}
    int getColumn() const { return column_; }
private:
    int column_;
};

/**
 * @brief Exception for structurally invalid actions
 *
 * The action would be invalid on any board (unknown kind, column outside
 * the board). Indicates a broken agent and ends the game.
 */
class ProtocolError : public GameStateException {
public:
    explicit ProtocolError(const std::string& message)
        : GameStateException(message) {}
};

/**
 * @brief Exception for invalid construction arguments
 */
class GameConstructionError : public std::invalid_argument {
public:
    explicit GameConstructionError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_ERRORS_H
