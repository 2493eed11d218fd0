// token_map.cpp
#include "connectfour/core/token_map.h"
#include "connectfour/core/errors.h"
#include <string>

namespace connectfour {
namespace core {

TokenMap::TokenMap(const std::vector<Token>& tokens) {
    if (tokens.size() > static_cast<size_t>(MAX_TOKENS)) {
        throw GameConstructionError(
            "At most " + std::to_string(MAX_TOKENS) + " tokens are supported, got " +
            std::to_string(tokens.size()));
    }

    inverse_.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (token.empty()) {
            throw GameConstructionError("Tokens must not be empty");
        }

        InternalId id = static_cast<InternalId>(inverse_.size() + 1);
        if (!forward_.emplace(token, id).second) {
            throw GameConstructionError("Duplicate token: " + token);
        }
        inverse_.push_back(token);
    }
}

InternalId TokenMap::toInternal(const Token& token) const {
    auto it = forward_.find(token);
    if (it == forward_.end()) {
        throw GameStateException("Unknown token: " + token);
    }
    return it->second;
}

const Token& TokenMap::toExternal(InternalId id) const {
    if (id == EMPTY_CELL || id > inverse_.size()) {
        throw GameStateException("Unknown internal id: " + std::to_string(static_cast<int>(id)));
    }
    return inverse_[id - 1];
}

} // namespace core
} // namespace connectfour
