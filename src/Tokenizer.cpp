/**
 * @file Tokenizer.cpp
 * @brief Implementation of the path tokenizer
 */

#include "tomlpath/Tokenizer.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

namespace tomlpath {

namespace {
    /**
     * @brief Split on every occurrence of the separator, keeping empty parts
     *
     * "a..b" → ["a", "", "b"], "." → ["", ""]
     */
    std::vector<std::string> split_segments(const std::string& path, char separator) {
        std::vector<std::string> segments;
        std::string current;

        for (char c : path) {
            if (c == separator) {
                segments.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        segments.push_back(current);

        return segments;
    }

    /**
     * @brief Check for the "[...]" form
     */
    bool is_bracketed(const std::string& segment) {
        return segment.size() >= 2 && segment.front() == '[' && segment.back() == ']';
    }

    /**
     * @brief Build a token from one non-empty segment
     */
    Token make_token(const std::string& segment) {
        if (!is_bracketed(segment)) {
            return Token::identifier(segment);
        }

        static const std::regex index_re("^-?[0-9]+$");
        const std::string inner = segment.substr(1, segment.size() - 2);
        if (!std::regex_match(inner, index_re)) {
            throw ArrayAccessWithoutIndex(segment);
        }

        try {
            size_t pos = 0;
            long long idx = std::stoll(inner, &pos);
            if (pos != inner.size()) {
                throw ArrayAccessWithoutIndex(segment);
            }
            return Token::index(static_cast<std::int64_t>(idx));
        } catch (const std::out_of_range&) {
            throw ArrayAccessWithoutIndex(segment);
        }
    }
}

TokenChain tokenize(const std::string& path, char separator) {
    if (path.empty()) {
        throw EmptyQueryError();
    }

    TokenChain tokens;
    for (const auto& segment : split_segments(path, separator)) {
        if (segment.empty()) {
            throw EmptyIdentifier(path);
        }
        tokens.push_back(make_token(segment));
    }

    return tokens;
}

std::string join_path(TokenChain::const_iterator first,
                      TokenChain::const_iterator last,
                      char separator) {
    std::ostringstream oss;
    for (auto it = first; it != last; ++it) {
        if (it != first) oss << separator;
        if (it->is_index()) {
            oss << '[' << it->idx() << ']';
        } else {
            oss << it->ident();
        }
    }
    return oss.str();
}

} // namespace tomlpath
