/**
 * @file Delete.cpp
 * @brief Implementation of remove()
 */

#include "tomlpath/Delete.hpp"
#include "tomlpath/Resolver.hpp"

#include <cstddef>
#include <utility>

namespace tomlpath {

namespace {
    /**
     * @brief Refuse to drop a container that still holds entries
     */
    void ensure_removable(const Value& node, const std::string& path) {
        const bool populated =
            (node.is_table() && !node.as_table()->empty()) ||
            (node.is_array() && !node.as_array()->empty());
        if (populated) {
            throw CannotDeleteNonEmpty(path, type_name(node));
        }
    }
}

std::optional<Value> remove_with_separator(Value& doc, const std::string& path, char separator) {
    const TokenChain tokens = tokenize(path, separator);
    const auto first = tokens.begin();
    const auto last = tokens.end() - 1;

    Value* parent = resolve_mut(doc, first, last, separator);
    if (parent == nullptr) {
        return std::nullopt;
    }

    if (last->is_identifier()) {
        if (auto* table = parent->as_table()) {
            auto found = table->find(last->ident());
            if (found == table->end()) {
                return std::nullopt;
            }
            ensure_removable(found->second, path);
            Value removed = std::move(found->second);
            table->erase(found);
            return removed;
        }
    } else if (auto* array = parent->as_array()) {
        if (!detail::index_in_range(last->idx(), *array)) {
            return std::nullopt;
        }
        auto pos = array->begin() + last->idx();
        ensure_removable(*pos, path);
        Value removed = std::move(*pos);
        array->erase(pos);
        return removed;
    }

    detail::throw_mismatch(*parent, first, last, separator);
}

} // namespace tomlpath
