// action.cpp
#include "connectfour/core/action.h"
#include "connectfour/core/errors.h"
#include <algorithm>
#include <cctype>

namespace connectfour {
namespace core {

std::string actionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::PLACE:
            return "PLACE";
    }
    throw ProtocolError("Unknown action kind: " + std::to_string(static_cast<int>(kind)));
}

std::optional<ActionKind> actionKindFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "PLACE") {
        return ActionKind::PLACE;
    }
    return std::nullopt;
}

std::string Action::toString() const {
    return actionKindToString(kind) + ", " + std::to_string(column);
}

} // namespace core
} // namespace connectfour
