/**
 * @file Resolver.cpp
 * @brief Implementation of read-only and mutable resolution
 */

#include "tomlpath/Resolver.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace tomlpath {

namespace detail {

void throw_mismatch(const Value& node,
                    TokenChain::const_iterator first,
                    TokenChain::const_iterator at,
                    char separator) {
    std::string partial_path = join_path(first, at + 1, separator);

    if (at->is_identifier()) {
        if (node.is_array()) {
            throw NoIdentifierInArray(std::move(partial_path), at->ident());
        }
        throw QueryingValueAsTable(std::move(partial_path), at->ident(), type_name(node));
    }

    if (node.is_table()) {
        throw NoIndexInTable(std::move(partial_path), at->idx());
    }
    throw QueryingValueAsArray(std::move(partial_path), at->idx(), type_name(node));
}

} // namespace detail

namespace {
    /**
     * @brief Apply one token to a node
     *
     * V is `const Value` for the read-only walk and `Value` for the
     * mutable one; the traversal is otherwise identical.
     *
     * @return Child node, or nullptr if the key/index is absent
     */
    template <typename V>
    V* step(V& node, TokenChain::const_iterator first,
            TokenChain::const_iterator at, char separator) {
        if (at->is_identifier()) {
            if (auto* table = node.as_table()) {
                auto found = table->find(at->ident());
                return found == table->end() ? nullptr : &found->second;
            }
        } else if (auto* array = node.as_array()) {
            if (!detail::index_in_range(at->idx(), *array)) {
                return nullptr;
            }
            return &(*array)[static_cast<std::size_t>(at->idx())];
        }

        detail::throw_mismatch(node, first, at, separator);
    }

    template <typename V>
    V* walk(V& doc, TokenChain::const_iterator first,
            TokenChain::const_iterator last, char separator) {
        V* current = &doc;
        for (auto it = first; it != last; ++it) {
            current = step(*current, first, it, separator);
            if (current == nullptr) {
                return nullptr;
            }
        }
        return current;
    }
}

const Value* resolve(const Value& doc, const TokenChain& tokens, char separator) {
    return walk(doc, tokens.begin(), tokens.end(), separator);
}

Value* resolve_mut(Value& doc, const TokenChain& tokens, char separator) {
    return walk(doc, tokens.begin(), tokens.end(), separator);
}

const Value* resolve(const Value& doc, TokenChain::const_iterator first,
                     TokenChain::const_iterator last, char separator) {
    return walk(doc, first, last, separator);
}

Value* resolve_mut(Value& doc, TokenChain::const_iterator first,
                   TokenChain::const_iterator last, char separator) {
    return walk(doc, first, last, separator);
}

} // namespace tomlpath
