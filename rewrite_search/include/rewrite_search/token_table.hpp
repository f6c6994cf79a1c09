#ifndef REWRITE_SEARCH_TOKEN_TABLE_HPP
#define REWRITE_SEARCH_TOKEN_TABLE_HPP

#include <rewrite_search/types.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rewrite_search {

/**
 * Interned fragment of pretty-printed expressions.
 * frequency = (occurrences in left-side expressions, occurrences in right-side expressions)
 */
struct Token {
    TokenId id{INVALID_TOKEN};
    std::string text;
    std::pair<std::size_t, std::size_t> frequency{0, 0};

    std::size_t count(Side side) const {
        return side == Side::LEFT ? frequency.first : frequency.second;
    }

    void increment(Side side) {
        if (side == Side::LEFT) {
            ++frequency.first;
        } else {
            ++frequency.second;
        }
    }
};

/**
 * Split pretty-printed text into token strings.
 * Identifier runs (alphanumerics, '_', '.', '\'') form one token, every other
 * non-blank character is a token on its own, whitespace only separates.
 */
std::vector<std::string> tokenize(const std::string& pretty);

/**
 * Token interning table. Ids are sequential, tokens are never removed.
 */
class TokenTable {
private:
    std::vector<Token> tokens_;
    std::unordered_map<std::string, TokenId> index_;

public:
    TokenTable() = default;

    /**
     * Return the token for text, counting one more occurrence on side.
     * A new token gets the next id and frequency 1 on side.
     */
    Token find_or_create(const std::string& text, Side side);

    /**
     * Tokenize pretty text and intern every token, returning the id sequence.
     */
    std::vector<TokenId> intern(const std::string& pretty, Side side);

    std::optional<Token> find(const std::string& text) const;

    const Token& get(TokenId id) const;

    std::size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }

    const std::vector<Token>& tokens() const { return tokens_; }
};

} // namespace rewrite_search

#endif // REWRITE_SEARCH_TOKEN_TABLE_HPP
