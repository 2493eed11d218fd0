// random_agent.cpp
#include "connectfour/agents/random_agent.h"
#include "connectfour/core/errors.h"
#include <chrono>
#include <utility>
#include <vector>

namespace connectfour {
namespace agents {

RandomAgent::RandomAgent(core::Token token, unsigned int seed)
    : Agent(std::move(token)) {

    unsigned int actualSeed = seed;
    if (actualSeed == 0) {
        actualSeed = static_cast<unsigned int>(
            std::chrono::system_clock::now().time_since_epoch().count());
    }

    rng_.seed(actualSeed);
}

core::Action RandomAgent::selectAction(const core::StateView& view) {
    std::vector<int> open = view.openColumns();
    if (open.empty()) {
        throw core::GameStateException("RandomAgent " + getToken() + ": no open column to play");
    }

    std::uniform_int_distribution<size_t> dist(0, open.size() - 1);
    return core::Action::place(open[dist(rng_)]);
}

void RandomAgent::notifyOutcome(const core::Outcome& /*outcome*/) {
}

} // namespace agents
} // namespace connectfour
