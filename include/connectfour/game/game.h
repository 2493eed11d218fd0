// game.h
#ifndef CONNECTFOUR_GAME_H
#define CONNECTFOUR_GAME_H

#include <vector>
#include <memory>
#include <random>
#include <utility>

#include "connectfour/types.h"
#include "connectfour/core/action.h"
#include "connectfour/core/game_config.h"
#include "connectfour/core/game_state.h"
#include "connectfour/core/outcome.h"
#include "connectfour/agents/agent.h"

namespace connectfour {
namespace game {

/**
 * @brief Lifecycle of a game
 */
enum class GameStatus {
    NOT_STARTED,
    IN_PROGRESS,
    WON,
    DRAWN,
    FORFEITED,
    ABORTED     // halted by a protocol error
};

/**
 * @brief Referee mediating every interaction between agents and state
 *
 * Agents are created before the game and passed to the constructor.
 * play() draws a turn order once, then asks the agents for actions in that
 * fixed cyclic order until the state reports a win or a draw. Every agent
 * is notified of the outcome before play() returns.
 *
 * Actions that are invalid on any board (unknown kind, column outside the
 * board) are protocol errors and end the game with a ProtocolError. A full
 * column is an ordinary rule violation: the same agent is asked again, and
 * after GameConfig::maxInvalidAttempts consecutive failures it forfeits the
 * game (LOSE for it, WIN for everyone else).
 */
class Game {
public:
    /**
     * @brief Constructor
     *
     * @param agents At least two agents with pairwise distinct tokens
     * @param size Board dimensions (both > 0)
     * @param config Seed, retry bound; its rows/columns are ignored in favour of size
     * @throws GameConstructionError on invalid agents, size or config
     */
    Game(std::vector<std::shared_ptr<agents::Agent>> agents,
         core::BoardSize size = core::BoardSize{},
         core::GameConfig config = core::GameConfig{});

    /**
     * @brief Constructor taking the board size from the configuration
     */
    Game(std::vector<std::shared_ptr<agents::Agent>> agents, const core::GameConfig& config)
        : Game(std::move(agents), config.getBoardSize(), config) {}

    /**
     * @brief Play the game to the end
     *
     * @return Finalized outcome, also passed to every agent
     * @throws ProtocolError if an agent returns a structurally invalid action
     * @throws GameStateException if the game has already been played
     */
    core::Outcome play();

    GameStatus getStatus() const { return status_; }

    /**
     * @brief Tokens in the order they take turns (empty before play())
     */
    const std::vector<core::Token>& getTurnOrder() const { return turnOrder_; }

    core::BoardSize getBoardSize() const { return size_; }
    const std::vector<std::shared_ptr<agents::Agent>>& getAgents() const { return agents_; }

private:
    std::vector<std::shared_ptr<agents::Agent>> agents_;
    core::BoardSize size_;
    core::GameConfig config_;
    std::mt19937 rng_;
    GameStatus status_;
    std::vector<core::Token> turnOrder_;

    std::vector<core::Token> tokens() const;

    // Structural checks, independent of the board contents
    void validateAction(const agents::Agent& agent, const core::Action& action) const;

    // Apply an action; false if the state rejected it
    bool applyAction(core::GameState& state, const agents::Agent& agent, const core::Action& action);

    void finishWin(core::Outcome& outcome, const core::Token& winner);
    void finishDraw(core::Outcome& outcome);
    void finishForfeit(core::Outcome& outcome, const core::Token& forfeiter);
};

const char* gameStatusToString(GameStatus status);

} // namespace game
} // namespace connectfour

#endif // CONNECTFOUR_GAME_H
