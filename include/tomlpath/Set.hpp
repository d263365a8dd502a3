/**
 * @file Set.hpp
 * @brief Replace a node without creating missing structure
 */

#ifndef TOMLPATH_SET_HPP
#define TOMLPATH_SET_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Value.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tomlpath {

/**
 * @brief Set a value at an existing location (custom separator)
 *
 * Everything up to the last segment must already exist. The last segment
 * may name a new key of a Table, but an Index must address an existing
 * element.
 *
 * @return Previous value at the location, or std::nullopt for a new key
 * @throws NotAvailable if an intermediate node is absent
 * @throws IndexOutOfBounds if the final Index is outside [0, size)
 * @throws StructureError subclass if the path does not fit the document
 */
std::optional<Value> set_with_separator(Value& doc, const std::string& path,
                                        char separator, Value value);

inline std::optional<Value> set(Value& doc, const std::string& path, Value value) {
    return set_with_separator(doc, path, kDefaultSeparator, std::move(value));
}

} // namespace tomlpath

#endif // TOMLPATH_SET_HPP
