/**
 * @file Set.cpp
 * @brief Implementation of set()
 */

#include "tomlpath/Set.hpp"
#include "tomlpath/Resolver.hpp"

#include <cstddef>
#include <utility>

namespace tomlpath {

std::optional<Value> set_with_separator(Value& doc, const std::string& path,
                                        char separator, Value value) {
    const TokenChain tokens = tokenize(path, separator);
    const auto first = tokens.begin();
    const auto last = tokens.end() - 1;

    Value* parent = resolve_mut(doc, first, last, separator);
    if (parent == nullptr) {
        throw NotAvailable(join_path(first, last, separator));
    }

    if (last->is_identifier()) {
        if (auto* table = parent->as_table()) {
            auto found = table->find(last->ident());
            if (found == table->end()) {
                table->emplace(last->ident(), std::move(value));
                return std::nullopt;
            }
            return std::exchange(found->second, std::move(value));
        }
    } else if (auto* array = parent->as_array()) {
        if (!detail::index_in_range(last->idx(), *array)) {
            throw IndexOutOfBounds(join_path(tokens, separator), last->idx(), array->size());
        }
        return std::exchange((*array)[static_cast<std::size_t>(last->idx())], std::move(value));
    }

    detail::throw_mismatch(*parent, first, last, separator);
}

} // namespace tomlpath
