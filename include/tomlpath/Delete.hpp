/**
 * @file Delete.hpp
 * @brief Remove a node from a document
 *
 * - An absent node (at the last segment or before it) is not an error:
 *   remove() returns std::nullopt and the document is unchanged
 * - Scalars and empty containers are removed and returned
 * - A Table or Array that still has entries is refused with
 *   CannotDeleteNonEmpty; empty it first or replace it with set()
 * - Structural mismatches throw as in the resolver
 */

#ifndef TOMLPATH_DELETE_HPP
#define TOMLPATH_DELETE_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Value.hpp"

#include <optional>
#include <string>

namespace tomlpath {

/**
 * @brief Remove the node at @p path (custom separator)
 *
 * @return The removed node, or std::nullopt if nothing was there
 * @throws CannotDeleteNonEmpty if the node is a populated Table or Array
 *
 * Examples:
 * ```cpp
 * Value doc = parse_toml("a = 1\nb = [2, 3]\n");
 * remove_with_separator(doc, "a", '.');       // → 1
 * remove_with_separator(doc, "b/[0]", '/');   // → 2, b == [3]
 * remove_with_separator(doc, "b", '.');       // throws CannotDeleteNonEmpty
 * ```
 */
std::optional<Value> remove_with_separator(Value& doc, const std::string& path, char separator);

inline std::optional<Value> remove(Value& doc, const std::string& path) {
    return remove_with_separator(doc, path, kDefaultSeparator);
}

} // namespace tomlpath

#endif // TOMLPATH_DELETE_HPP
