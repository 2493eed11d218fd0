// action.h
#ifndef CONNECTFOUR_ACTION_H
#define CONNECTFOUR_ACTION_H

#include <string>
#include <optional>

namespace connectfour {
namespace core {

/**
 * @brief Kinds of action an agent may request
 */
enum class ActionKind {
    PLACE
};

/**
 * @brief A move requested by an agent
 *
 * Columns are indexed from 1.
 */
struct Action {
    ActionKind kind = ActionKind::PLACE;
    int column = 0;

    static Action place(int column) { return Action{ActionKind::PLACE, column}; }

    std::string toString() const;

    bool operator==(const Action& other) const {
        return kind == other.kind && column == other.column;
    }
    bool operator!=(const Action& other) const { return !(*this == other); }
};

/**
 * @brief Name of an action kind ("PLACE")
 *
 * @throws ProtocolError for a value outside the enum
 */
std::string actionKindToString(ActionKind kind);

/**
 * @brief Parse an action kind name, case-insensitive
 *
 * @return Kind, or empty if the name is unknown
 */
std::optional<ActionKind> actionKindFromString(const std::string& name);

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_ACTION_H
