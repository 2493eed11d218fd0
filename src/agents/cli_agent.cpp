// cli_agent.cpp
#include "connectfour/agents/cli_agent.h"
#include "connectfour/core/errors.h"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace connectfour {
namespace agents {

CLIAgent::CLIAgent(core::Token token)
    : Agent(std::move(token)) {

    outputCallback_ = [](const std::string& message) {
        std::cout << message << std::endl;
    };

    inputCallback_ = []() {
        std::string line;
        if (!std::getline(std::cin, line)) {
            throw core::GameStateException("Standard input closed while waiting for a move");
        }
        return line;
    };
}

void CLIAgent::setOutputCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        outputCallback_ = std::move(callback);
    }
}

void CLIAgent::setInputCallback(std::function<std::string()> callback) {
    if (callback) {
        inputCallback_ = std::move(callback);
    }
}

void CLIAgent::output(const std::string& message) {
    outputCallback_(message);
}

std::string CLIAgent::input() {
    return inputCallback_();
}

core::Action CLIAgent::selectAction(const core::StateView& view) {
    output(view.toString());

    while (true) {
        output(getToken() + " to play.");
        std::string line = input();

        int column = 0;
        try {
            size_t consumed = 0;
            column = std::stoi(line, &consumed);
            if (line.find_first_not_of(" \t\r", consumed) != std::string::npos) {
                output("Input could not be converted to an integer.");
                continue;
            }
        } catch (const std::logic_error&) {
            output("Input could not be converted to an integer.");
            continue;
        }

        if (column < 1 || column > view.getColumns()) {
            output("Selected column lies outside the board. Columns are indexed from 1.");
            continue;
        }

        return core::Action::place(column);
    }
}

void CLIAgent::notifyOutcome(const core::Outcome& outcome) {
    output(getToken() + ": " + core::resultTagToString(outcome.getResult(getToken())));
}

} // namespace agents
} // namespace connectfour
