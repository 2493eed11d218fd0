// game.cpp
#include "connectfour/game/game.h"
#include "connectfour/core/errors.h"
#include <algorithm>
#include <chrono>
#include <numeric>
#include <string>
#include <spdlog/spdlog.h>

namespace connectfour {
namespace game {

namespace {
std::string joinTokens(const std::vector<core::Token>& tokens) {
    std::string joined;
    for (const auto& token : tokens) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += token;
    }
    return joined;
}
} // namespace

const char* gameStatusToString(GameStatus status) {
    switch (status) {
        case GameStatus::NOT_STARTED: return "NOT_STARTED";
        case GameStatus::IN_PROGRESS: return "IN_PROGRESS";
        case GameStatus::WON:         return "WON";
        case GameStatus::DRAWN:       return "DRAWN";
        case GameStatus::FORFEITED:   return "FORFEITED";
        case GameStatus::ABORTED:     return "ABORTED";
    }
    return "UNKNOWN";
}

Game::Game(std::vector<std::shared_ptr<agents::Agent>> agents,
           core::BoardSize size,
           core::GameConfig config)
    : agents_(std::move(agents)),
      size_(size),
      config_(std::move(config)),
      status_(GameStatus::NOT_STARTED) {

    if (agents_.size() < 2) {
        throw core::GameConstructionError(
            "A game needs at least 2 agents, got " + std::to_string(agents_.size()));
    }
    for (const auto& agent : agents_) {
        if (!agent) {
            throw core::GameConstructionError("Agents must not be null");
        }
    }

    config_.rows = size_.rows;
    config_.columns = size_.columns;
    config_.validate();

    // Rejects empty and duplicate tokens
    core::TokenMap tokenCheck{tokens()};

    unsigned int seed = config_.seed;
    if (seed == 0) {
        seed = static_cast<unsigned int>(
            std::chrono::system_clock::now().time_since_epoch().count());
    }
    rng_.seed(seed);
}

std::vector<core::Token> Game::tokens() const {
    std::vector<core::Token> result;
    result.reserve(agents_.size());
    for (const auto& agent : agents_) {
        result.push_back(agent->getToken());
    }
    return result;
}

core::Outcome Game::play() {
    if (status_ != GameStatus::NOT_STARTED) {
        throw core::GameStateException(
            std::string("Game cannot be played again, status is ") + gameStatusToString(status_));
    }

    // One permutation for the whole game, walked with a cyclic cursor
    std::vector<size_t> order(agents_.size());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng_);

    turnOrder_.clear();
    for (size_t index : order) {
        turnOrder_.push_back(agents_[index]->getToken());
    }

    core::GameState state(tokens(), size_);
    core::Outcome outcome(tokens());
    status_ = GameStatus::IN_PROGRESS;

    spdlog::info("Game: starting {}x{} game, turn order {}",
                 size_.rows, size_.columns, joinTokens(turnOrder_));

    size_t cursor = 0;
    int invalidAttempts = 0;

    try {
        while (status_ == GameStatus::IN_PROGRESS) {
            agents::Agent& agent = *agents_[order[cursor % order.size()]];
            core::Action action = agent.selectAction(state.exposeView());

            validateAction(agent, action);

            if (!applyAction(state, agent, action)) {
                if (++invalidAttempts >= config_.maxInvalidAttempts) {
                    finishForfeit(outcome, agent.getToken());
                }
                continue;
            }

            invalidAttempts = 0;
            outcome.appendToRecord(agent.getToken(), action);

            core::OutcomeCheck check = state.checkOutcome();
            switch (check.status) {
                case core::OutcomeStatus::WIN:
                    finishWin(outcome, *check.winner);
                    break;
                case core::OutcomeStatus::DRAW:
                    finishDraw(outcome);
                    break;
                case core::OutcomeStatus::UNFINISHED:
                    ++cursor;
                    break;
            }
        }
    } catch (...) {
        // Protocol errors and failing agents halt the game
        status_ = GameStatus::ABORTED;
        throw;
    }

    outcome.finalize();
    spdlog::info("Game: finished after {} moves ({})",
                 outcome.getRecord().size(), gameStatusToString(status_));

    for (const auto& participant : agents_) {
        participant->notifyOutcome(outcome);
    }

    return outcome;
}

void Game::validateAction(const agents::Agent& agent, const core::Action& action) const {
    switch (action.kind) {
        case core::ActionKind::PLACE:
            if (action.column < 1 || action.column > size_.columns) {
                spdlog::error("Game: agent {} chose column {} outside [1, {}]",
                              agent.getToken(), action.column, size_.columns);
                throw core::ProtocolError(
                    "Agent " + agent.getToken() + " chose column " + std::to_string(action.column) +
                    "; columns must lie within [1, " + std::to_string(size_.columns) + "]");
            }
            return;
    }

    spdlog::error("Game: agent {} returned unknown action kind {}",
                  agent.getToken(), static_cast<int>(action.kind));
    throw core::ProtocolError("Agent " + agent.getToken() +
                              " returned an unknown action kind; only PLACE is permitted");
}

bool Game::applyAction(core::GameState& state, const agents::Agent& agent, const core::Action& action) {
    switch (action.kind) {
        case core::ActionKind::PLACE:
            try {
                state.place(action.column, agent.getToken());
            } catch (const core::ActionError& e) {
                spdlog::warn("Game: rejected action of {}: {}", agent.getToken(), e.what());
                return false;
            }
            spdlog::debug("Game: {} placed in column {}", agent.getToken(), action.column);
            return true;
    }

    throw core::ProtocolError("Unsupported action kind");
}

void Game::finishWin(core::Outcome& outcome, const core::Token& winner) {
    for (const auto& agent : agents_) {
        const auto& token = agent->getToken();
        outcome.setResult(token, token == winner ? core::ResultTag::WIN : core::ResultTag::LOSE);
    }
    status_ = GameStatus::WON;
    spdlog::info("Game: {} wins", winner);
}

void Game::finishDraw(core::Outcome& outcome) {
    for (const auto& agent : agents_) {
        outcome.setResult(agent->getToken(), core::ResultTag::DRAW);
    }
    status_ = GameStatus::DRAWN;
    spdlog::info("Game: board full, draw");
}

void Game::finishForfeit(core::Outcome& outcome, const core::Token& forfeiter) {
    for (const auto& agent : agents_) {
        const auto& token = agent->getToken();
        outcome.setResult(token, token == forfeiter ? core::ResultTag::LOSE : core::ResultTag::WIN);
    }
    status_ = GameStatus::FORFEITED;
    spdlog::warn("Game: {} forfeits after {} invalid attempts", forfeiter, config_.maxInvalidAttempts);
}

} // namespace game
} // namespace connectfour
