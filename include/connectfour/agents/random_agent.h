// random_agent.h
#ifndef CONNECTFOUR_RANDOM_AGENT_H
#define CONNECTFOUR_RANDOM_AGENT_H

#include <random>

#include "connectfour/agents/agent.h"

namespace connectfour {
namespace agents {

/**
 * @brief Agent that drops its token into a uniformly chosen open column
 */
class RandomAgent : public Agent {
public:
    /**
     * @brief Constructor
     *
     * @param token Agent token
     * @param seed Random seed (0 for a time-based seed)
     */
    explicit RandomAgent(core::Token token, unsigned int seed = 0);

    /**
     * @throws GameStateException if every column is full
     */
    core::Action selectAction(const core::StateView& view) override;

    void notifyOutcome(const core::Outcome& outcome) override;

private:
    std::mt19937 rng_;
};

} // namespace agents
} // namespace connectfour

#endif // CONNECTFOUR_RANDOM_AGENT_H
