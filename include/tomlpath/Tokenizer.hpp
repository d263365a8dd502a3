/**
 * @file Tokenizer.hpp
 * @brief Path string tokenizer
 *
 * Turns a path like "a.b.[0].c" into an ordered chain of typed segments.
 * A segment is either an Identifier (a table key) or an Index (an array
 * position written as "[N]", N matching -?[0-9]+).
 *
 * Rules:
 * - An empty path raises EmptyQueryError
 * - An empty segment (leading, trailing or doubled separator) raises
 *   EmptyIdentifier
 * - A segment starting with '[' and ending with ']' is an Index; any
 *   content other than an int64 literal raises ArrayAccessWithoutIndex
 * - Every other segment is an Identifier, taken verbatim
 *
 * Tokenizing never looks at a document.
 */

#ifndef TOMLPATH_TOKENIZER_HPP
#define TOMLPATH_TOKENIZER_HPP

#include "tomlpath/Errors.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tomlpath {

/// Default path separator
constexpr char kDefaultSeparator = '.';

/**
 * @brief One parsed unit of a path
 */
class Token {
public:
    enum class Kind {
        Identifier,
        Index
    };

    static Token identifier(std::string ident) {
        return Token(Kind::Identifier, std::move(ident), 0);
    }

    static Token index(std::int64_t idx) {
        return Token(Kind::Index, std::string(), idx);
    }

    Kind kind() const noexcept { return kind_; }
    bool is_identifier() const noexcept { return kind_ == Kind::Identifier; }
    bool is_index() const noexcept { return kind_ == Kind::Index; }

    /**
     * @brief Table key of an Identifier token (empty for an Index)
     */
    const std::string& ident() const noexcept { return ident_; }

    /**
     * @brief Array position of an Index token (0 for an Identifier)
     */
    std::int64_t idx() const noexcept { return idx_; }

    bool operator==(const Token& other) const {
        return kind_ == other.kind_ && ident_ == other.ident_ && idx_ == other.idx_;
    }
    bool operator!=(const Token& other) const { return !(*this == other); }

private:
    Token(Kind kind, std::string ident, std::int64_t idx)
        : kind_(kind), ident_(std::move(ident)), idx_(idx) {}

    Kind kind_;
    std::string ident_;
    std::int64_t idx_;
};

/// Ordered, non-empty sequence of tokens produced by tokenize()
using TokenChain = std::vector<Token>;

/**
 * @brief Tokenize a path string
 *
 * @param path Path like "a.b.[0]"
 * @param separator Single separator character (default '.')
 * @return Non-empty token chain in left-to-right order
 * @throws EmptyQueryError if path is empty
 * @throws EmptyIdentifier if any segment is empty
 * @throws ArrayAccessWithoutIndex if a bracketed segment is not an integer
 *
 * Examples:
 * ```cpp
 * tokenize("a.b.c.[1000]");   // [Ident a, Ident b, Ident c, Index 1000]
 * tokenize("a/[-1]", '/');    // [Ident a, Index -1]
 * tokenize("a..b");           // throws EmptyIdentifier
 * tokenize("[x]");            // throws ArrayAccessWithoutIndex
 * ```
 */
TokenChain tokenize(const std::string& path, char separator = kDefaultSeparator);

/**
 * @brief Render tokens back to path syntax
 *
 * @param first Iterator to the first token to render
 * @param last Iterator past the last token to render
 * @param separator Separator to join with
 * @return Path string; indices are written as "[N]"
 *
 * Examples:
 * - [Ident a, Index 0, Ident b] → "a.[0].b"
 * - [] → ""
 */
std::string join_path(TokenChain::const_iterator first,
                      TokenChain::const_iterator last,
                      char separator = kDefaultSeparator);

/**
 * @brief Render a whole token chain back to path syntax
 */
inline std::string join_path(const TokenChain& tokens,
                             char separator = kDefaultSeparator) {
    return join_path(tokens.begin(), tokens.end(), separator);
}

} // namespace tomlpath

#endif // TOMLPATH_TOKENIZER_HPP
