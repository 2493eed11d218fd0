// token_map.h
#ifndef CONNECTFOUR_TOKEN_MAP_H
#define CONNECTFOUR_TOKEN_MAP_H

#include <vector>
#include <unordered_map>

#include "connectfour/types.h"

namespace connectfour {
namespace core {

/**
 * @brief Bijection between external tokens and internal ids
 *
 * Ids are assigned 1, 2, ... in the order the tokens are given. The map is
 * filled once by the constructor and never changes afterwards.
 */
class TokenMap {
public:
    /**
     * @brief Constructor
     *
     * @param tokens External tokens, pairwise distinct and non-empty
     * @throws GameConstructionError on a duplicate or empty token, or more
     *         than MAX_TOKENS tokens
     */
    explicit TokenMap(const std::vector<Token>& tokens);

    /**
     * @throws GameStateException if the token was not registered
     */
    InternalId toInternal(const Token& token) const;

    /**
     * @throws GameStateException for EMPTY_CELL or an unassigned id
     */
    const Token& toExternal(InternalId id) const;

    bool contains(const Token& token) const { return forward_.count(token) > 0; }
    size_t size() const { return inverse_.size(); }

    // Tokens in id order
    const std::vector<Token>& tokens() const { return inverse_; }

private:
    std::unordered_map<Token, InternalId> forward_;
    std::vector<Token> inverse_;  // inverse_[id - 1]
};

} // namespace core
} // namespace connectfour

#endif // CONNECTFOUR_TOKEN_MAP_H
