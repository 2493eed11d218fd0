// agent.h
#ifndef CONNECTFOUR_AGENT_H
#define CONNECTFOUR_AGENT_H

#include <utility>

#include "connectfour/types.h"
#include "connectfour/core/action.h"
#include "connectfour/core/state_view.h"
#include "connectfour/core/outcome.h"

namespace connectfour {
namespace agents {

/**
 * @brief Interface for game participants
 *
 * The orchestrator calls selectAction() with a fresh view whenever it is
 * this agent's turn, and notifyOutcome() once after the game has ended.
 * The call is synchronous and may block, e.g. while waiting for a human.
 */
class Agent {
public:
    /**
     * @brief Constructor
     *
     * @param token External token identifying this agent's pieces
     */
    explicit Agent(core::Token token) : token_(std::move(token)) {}

    virtual ~Agent() = default;

    /**
     * @brief Choose the next action
     *
     * @param view Snapshot of the current board
     * @return The requested action
     */
    virtual core::Action selectAction(const core::StateView& view) = 0;

    /**
     * @brief Receive the final outcome of the game
     *
     * @param outcome Finalized outcome
     */
    virtual void notifyOutcome(const core::Outcome& outcome) = 0;

    const core::Token& getToken() const { return token_; }

private:
    core::Token token_;
};

} // namespace agents
} // namespace connectfour

#endif // CONNECTFOUR_AGENT_H
