/**
 * @file Insert.cpp
 * @brief Implementation of auto-creating insert
 */

#include "tomlpath/Insert.hpp"
#include "tomlpath/Resolver.hpp"

#include <cstddef>
#include <utility>

namespace tomlpath {

namespace {

using TokenIt = TokenChain::const_iterator;

/**
 * @brief Empty container able to take the given token
 */
Value container_for(const Token& next) {
    return next.is_index() ? Value::array() : Value::table();
}

/**
 * @brief Descend one intermediate segment, creating it if missing
 * @pre @p at is not the last token
 */
Value& descend_or_create(Value& node, TokenIt first, TokenIt at, char separator) {
    const Token& next = *(at + 1);

    if (at->is_identifier()) {
        if (auto* table = node.as_table()) {
            auto found = table->find(at->ident());
            if (found == table->end()) {
                found = table->emplace(at->ident(), container_for(next)).first;
            }
            return found->second;
        }
    } else if (auto* array = node.as_array()) {
        if (detail::index_in_range(at->idx(), *array)) {
            return (*array)[static_cast<std::size_t>(at->idx())];
        }
        array->push_back(container_for(next));
        return array->back();
    }

    detail::throw_mismatch(node, first, at, separator);
}

/**
 * @brief Store the value at the final segment
 */
std::optional<Value> place(Value& parent, TokenIt first, TokenIt at,
                           char separator, Value value) {
    if (at->is_identifier()) {
        if (auto* table = parent.as_table()) {
            auto found = table->find(at->ident());
            if (found == table->end()) {
                table->emplace(at->ident(), std::move(value));
                return std::nullopt;
            }
            return std::exchange(found->second, std::move(value));
        }
    } else if (auto* array = parent.as_array()) {
        if (detail::index_in_range(at->idx(), *array)) {
            array->insert(array->begin() + at->idx(), std::move(value));
        } else {
            array->push_back(std::move(value));
        }
        return std::nullopt;
    }

    detail::throw_mismatch(parent, first, at, separator);
}

std::optional<Value> insert_tokens(Value& doc, const TokenChain& tokens,
                                   char separator, Value value) {
    const TokenIt first = tokens.begin();
    const TokenIt last = tokens.end() - 1;

    Value* current = &doc;
    for (auto it = first; it != last; ++it) {
        current = &descend_or_create(*current, first, it, separator);
    }
    return place(*current, first, last, separator, std::move(value));
}

/**
 * @brief Dry run of insert_tokens()
 *
 * Once the walk leaves existing structure, everything below is created
 * fresh and cannot fail, so only existing nodes need checking.
 */
void validate_tokens(const Value& doc, const TokenChain& tokens, char separator) {
    const TokenIt first = tokens.begin();
    const Value* current = &doc;

    for (auto it = first; it != tokens.end(); ++it) {
        const bool is_last = (it + 1 == tokens.end());

        if (it->is_identifier()) {
            const Table* table = current->as_table();
            if (table == nullptr) {
                detail::throw_mismatch(*current, first, it, separator);
            }
            auto found = table->find(it->ident());
            if (is_last || found == table->end()) {
                return;
            }
            current = &found->second;
        } else {
            const Array* array = current->as_array();
            if (array == nullptr) {
                detail::throw_mismatch(*current, first, it, separator);
            }
            if (is_last || !detail::index_in_range(it->idx(), *array)) {
                return;
            }
            current = &(*array)[static_cast<std::size_t>(it->idx())];
        }
    }
}

} // namespace

std::optional<Value> insert_with_separator(Value& doc, const std::string& path,
                                           char separator, Value value) {
    const TokenChain tokens = tokenize(path, separator);
    return insert_tokens(doc, tokens, separator, std::move(value));
}

std::optional<Value> insert_validated_with_separator(Value& doc, const std::string& path,
                                                     char separator, Value value) {
    const TokenChain tokens = tokenize(path, separator);
    validate_tokens(doc, tokens, separator);
    return insert_tokens(doc, tokens, separator, std::move(value));
}

} // namespace tomlpath
