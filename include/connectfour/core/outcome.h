// outcome.h
#ifndef CONNECTFOUR_OUTCOME_H
#define CONNECTFOUR_OUTCOME_H

#include <vector>
#include <string>
#include <optional>

#include "connectfour/types.h"
#include "connectfour/core/action.h"

namespace connectfour {
namespace core {

/**
 * @brief Result of a game for one agent
 */
enum class ResultTag {
    PENDING,
    WIN,
    LOSE,
    DRAW
};

std::string resultTagToString(ResultTag tag);
std::optional<ResultTag> resultTagFromString(const std::string& name);

/**
 * @brief Result entry for one participating agent
 */
struct AgentResult {
    Token token;
    ResultTag result = ResultTag::PENDING;
};

/**
 * @brief One successful action in the game record
 */
struct RecordEntry {
    Token token;
    Action action;
};

/**
 * @brief Record of the progress and outcome of a game
 *
 * Results are kept in agent registration order and start out PENDING. The
 * record lists every successful action in the order it was applied, so a
 * game can be replayed from it. Once finalize() has been called the
 * outcome no longer accepts changes.
 */
class Outcome {
public:
    /**
     * @brief Constructor
     *
     * @param tokens Tokens of the participating agents, in registration order
     * @throws GameConstructionError on duplicate tokens
     */
    explicit Outcome(const std::vector<Token>& tokens);

    /**
     * @brief Append an applied action to the record
     *
     * @throws GameStateException if finalized or the token is unknown
     */
    void appendToRecord(const Token& token, const Action& action);

    /**
     * @brief Set the result of one agent
     *
     * @throws GameStateException if finalized or the token is unknown
     */
    void setResult(const Token& token, ResultTag result);

    /**
     * @brief Freeze the outcome
     *
     * @throws GameStateException if already finalized or a result is still PENDING
     */
    void finalize();

    bool isFinalized() const { return finalized_; }

    /**
     * @throws GameStateException if the token is unknown
     */
    ResultTag getResult(const Token& token) const;

    const std::vector<AgentResult>& getResults() const { return results_; }
    const std::vector<RecordEntry>& getRecord() const { return record_; }

    /**
     * @brief Human-readable summary: agent outcomes, then the action record
     */
    std::string toString() const;

    /**
     * @brief Serialize to JSON
     *
     * @return Pretty-printed JSON with "results", "record" and "finalized"
     */
    std::string toJson() const;

    /**
     * @brief Deserialize from JSON
     *
     * @throws GameStateException on malformed input
     */
    static Outcome fromJson(const std::string& json);

    /**
     * @brief Save the JSON form to a file
     *
     * @return true if successful, false if the file could not be written
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * @throws GameStateException if the file cannot be read or parsed
     */
    static Outcome loadFromFile(const std::string& filename);

private:
    std::vector<AgentResult> results_;
    std::vector<RecordEntry> record_;
    bool finalized_ = false;

    AgentResult& findResult(const Token& token);
    const AgentResult& findResult(const Token& token) const;
    void checkMutable() const;
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_OUTCOME_H
