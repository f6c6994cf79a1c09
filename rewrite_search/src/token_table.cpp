#include <rewrite_search/token_table.hpp>
#include <cctype>

namespace rewrite_search {

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '\'';
}

} // anonymous namespace

std::vector<std::string> tokenize(const std::string& pretty) {
    std::vector<std::string> result;
    std::size_t i = 0;
    while (i < pretty.size()) {
        char c = pretty[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (is_identifier_char(c)) {
            std::size_t start = i;
            while (i < pretty.size() && is_identifier_char(pretty[i])) {
                ++i;
            }
            result.push_back(pretty.substr(start, i - start));
        } else {
            result.emplace_back(1, c);
            ++i;
        }
    }
    return result;
}

Token TokenTable::find_or_create(const std::string& text, Side side) {
    auto it = index_.find(text);
    if (it != index_.end()) {
        Token updated = tokens_[it->second];
        updated.increment(side);
        tokens_[it->second] = updated;
        return updated;
    }

    Token token;
    token.id = tokens_.size();
    token.text = text;
    token.increment(side);
    index_.emplace(text, token.id);
    tokens_.push_back(token);
    return token;
}

std::vector<TokenId> TokenTable::intern(const std::string& pretty, Side side) {
    std::vector<TokenId> ids;
    for (const auto& text : tokenize(pretty)) {
        ids.push_back(find_or_create(text, side).id);
    }
    return ids;
}

std::optional<Token> TokenTable::find(const std::string& text) const {
    auto it = index_.find(text);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return tokens_[it->second];
}

const Token& TokenTable::get(TokenId id) const {
    if (id >= tokens_.size()) {
        throw InvariantViolation("TokenTable::get: token id " + std::to_string(id) +
                                 " out of range (size " + std::to_string(tokens_.size()) + ")");
    }
    return tokens_[id];
}

} // namespace rewrite_search
