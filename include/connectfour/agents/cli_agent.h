// cli_agent.h
#ifndef CONNECTFOUR_CLI_AGENT_H
#define CONNECTFOUR_CLI_AGENT_H

#include <string>
#include <functional>

#include "connectfour/agents/agent.h"

namespace connectfour {
namespace agents {

/**
 * @brief Agent driven by a human at the command line
 *
 * Prints the board, then asks for a column until the answer is an integer
 * inside the board. Input and output go through callbacks so the agent can
 * be driven by something other than stdin/stdout.
 */
class CLIAgent : public Agent {
public:
    explicit CLIAgent(core::Token token);

    core::Action selectAction(const core::StateView& view) override;
    void notifyOutcome(const core::Outcome& outcome) override;

    /**
     * @brief Set output callback
     *
     * @param callback Receives one message per call
     */
    void setOutputCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Set input callback
     *
     * @param callback Returns one line of input per call; throws once input is exhausted
     */
    void setInputCallback(std::function<std::string()> callback);

private:
    std::function<void(const std::string&)> outputCallback_;
    std::function<std::string()> inputCallback_;

    void output(const std::string& message);
    std::string input();
};

} // namespace agents
} // namespace connectfour

#endif // CONNECTFOUR_CLI_AGENT_H
