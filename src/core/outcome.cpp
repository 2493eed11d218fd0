// outcome.cpp
#include "connectfour/core/outcome.h"
#include "connectfour/core/errors.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <set>
#include <nlohmann/json.hpp>

namespace connectfour {
namespace core {

using json = nlohmann::json;

std::string resultTagToString(ResultTag tag) {
    switch (tag) {
        case ResultTag::PENDING: return "PENDING";
        case ResultTag::WIN:     return "WIN";
        case ResultTag::LOSE:    return "LOSE";
        case ResultTag::DRAW:    return "DRAW";
    }
    throw GameStateException("Unknown result tag: " + std::to_string(static_cast<int>(tag)));
}

std::optional<ResultTag> resultTagFromString(const std::string& name) {
    if (name == "PENDING") return ResultTag::PENDING;
    if (name == "WIN") return ResultTag::WIN;
    if (name == "LOSE") return ResultTag::LOSE;
    if (name == "DRAW") return ResultTag::DRAW;
    return std::nullopt;
}

Outcome::Outcome(const std::vector<Token>& tokens) {
    std::set<Token> seen;
    for (const auto& token : tokens) {
        if (!seen.insert(token).second) {
            throw GameConstructionError("Duplicate token in outcome: " + token);
        }
        results_.push_back(AgentResult{token, ResultTag::PENDING});
    }
}

void Outcome::checkMutable() const {
    if (finalized_) {
        throw GameStateException("Outcome is finalized and can no longer change");
    }
}

AgentResult& Outcome::findResult(const Token& token) {
    auto it = std::find_if(results_.begin(), results_.end(),
        [&](const AgentResult& entry) { return entry.token == token; });
    if (it == results_.end()) {
        throw GameStateException("Token is not part of this outcome: " + token);
    }
    return *it;
}

const AgentResult& Outcome::findResult(const Token& token) const {
    auto it = std::find_if(results_.begin(), results_.end(),
        [&](const AgentResult& entry) { return entry.token == token; });
    if (it == results_.end()) {
        throw GameStateException("Token is not part of this outcome: " + token);
    }
    return *it;
}

void Outcome::appendToRecord(const Token& token, const Action& action) {
    checkMutable();
    findResult(token);
    record_.push_back(RecordEntry{token, action});
}

void Outcome::setResult(const Token& token, ResultTag result) {
    checkMutable();
    findResult(token).result = result;
}

void Outcome::finalize() {
    checkMutable();
    for (const auto& entry : results_) {
        if (entry.result == ResultTag::PENDING) {
            throw GameStateException("Cannot finalize outcome: result of " + entry.token + " is pending");
        }
    }
    finalized_ = true;
}

ResultTag Outcome::getResult(const Token& token) const {
    return findResult(token).result;
}

std::string Outcome::toString() const {
    std::ostringstream ss;
    ss << "Agent outcomes";
    for (const auto& entry : results_) {
        ss << '\n' << entry.token << ": " << resultTagToString(entry.result);
    }
    ss << "\nAction record";
    for (const auto& entry : record_) {
        ss << '\n' << entry.token << ", " << entry.action.toString();
    }
    return ss.str();
}

std::string Outcome::toJson() const {
    json j;

    json results_json = json::array();
    for (const auto& entry : results_) {
        results_json.push_back({
            {"token", entry.token},
            {"result", resultTagToString(entry.result)}
        });
    }
    j["results"] = results_json;

    json record_json = json::array();
    for (const auto& entry : record_) {
        record_json.push_back({
            {"token", entry.token},
            {"action", actionKindToString(entry.action.kind)},
            {"column", entry.action.column}
        });
    }
    j["record"] = record_json;
    j["finalized"] = finalized_;

    return j.dump(4);
}

Outcome Outcome::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        std::vector<Token> tokens;
        std::vector<ResultTag> tags;
        for (const auto& entry : j.at("results")) {
            tokens.push_back(entry.at("token").get<std::string>());

            std::string name = entry.at("result").get<std::string>();
            auto tag = resultTagFromString(name);
            if (!tag) {
                throw GameStateException("Unknown result tag: " + name);
            }
            tags.push_back(*tag);
        }

        Outcome outcome(tokens);
        for (size_t i = 0; i < tokens.size(); ++i) {
            outcome.results_[i].result = tags[i];
        }

        for (const auto& entry : j.at("record")) {
            std::string kindName = entry.at("action").get<std::string>();
            auto kind = actionKindFromString(kindName);
            if (!kind) {
                throw GameStateException("Unknown action kind: " + kindName);
            }
            outcome.appendToRecord(entry.at("token").get<std::string>(),
                                   Action{*kind, entry.at("column").get<int>()});
        }

        if (j.value("finalized", false)) {
            outcome.finalize();
        }
        return outcome;
    } catch (const json::exception& e) {
        throw GameStateException("Failed to parse outcome JSON: " + std::string(e.what()));
    } catch (const GameConstructionError& e) {
        throw GameStateException("Invalid outcome JSON: " + std::string(e.what()));
    }
}

bool Outcome::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << toJson();
    return file.good();
}

Outcome Outcome::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GameStateException("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

} // namespace core
} // namespace connectfour
