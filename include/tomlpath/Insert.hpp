/**
 * @file Insert.hpp
 * @brief Auto-creating writes into a document
 *
 * insert() walks the path like the mutable resolver but materializes
 * missing structure instead of stopping:
 * - A missing key gets a new empty container: an Array if the next
 *   segment is an Index, a Table otherwise
 * - An Index past the end of an Array (or negative) appends a new element
 *   instead; the requested position is only a hint once it exceeds the
 *   current size
 * - An Index inside [0, size) descends into the existing element
 * - An existing scalar on the way is never replaced; walking into it
 *   throws the usual StructureError
 *
 * At the final segment:
 * - Identifier on a Table: inserts or replaces the entry, returning the
 *   previous value if one was replaced
 * - Index on an Array: inserts before the element at that position (or
 *   appends if out of range) and returns std::nullopt
 *
 * Structural errors can only come from nodes that already exist, and the
 * walk creates nothing before it has left existing structure, so a failed
 * insert() leaves the document as it was. insert_validated() makes that
 * explicit: it dry-runs the walk first and only mutates when the whole
 * path would succeed.
 */

#ifndef TOMLPATH_INSERT_HPP
#define TOMLPATH_INSERT_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Value.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tomlpath {

/**
 * @brief Insert a value, creating missing structure (custom separator)
 *
 * @param doc Document root (modified in place)
 * @param path Path like "a.b.[0]"
 * @param separator Path separator
 * @param value Value to store
 * @return Previous value if an existing table entry was overwritten,
 *         std::nullopt otherwise
 * @throws TokenizeError if path is malformed (document untouched)
 * @throws StructureError if the path runs into an incompatible node
 *
 * Examples:
 * ```cpp
 * Value doc = parse_toml("array = []\n");
 * insert(doc, "array.[0]", 1);        // array == [1], returns nullopt
 * insert(doc, "x.y.[7].z", "v");      // x.y == [{z = "v"}]
 * insert(doc, "x.y.[0].z", "w");      // returns "v"
 * ```
 */
std::optional<Value> insert_with_separator(Value& doc, const std::string& path,
                                           char separator, Value value);

/**
 * @brief Insert a value, creating missing structure ('.' separator)
 */
inline std::optional<Value> insert(Value& doc, const std::string& path, Value value) {
    return insert_with_separator(doc, path, kDefaultSeparator, std::move(value));
}

/**
 * @brief Insert with validate-then-commit semantics (custom separator)
 *
 * Same result as insert_with_separator() on success. On failure the
 * document is left exactly as it was.
 */
std::optional<Value> insert_validated_with_separator(Value& doc, const std::string& path,
                                                     char separator, Value value);

/**
 * @brief Insert with validate-then-commit semantics ('.' separator)
 */
inline std::optional<Value> insert_validated(Value& doc, const std::string& path, Value value) {
    return insert_validated_with_separator(doc, path, kDefaultSeparator, std::move(value));
}

} // namespace tomlpath

#endif // TOMLPATH_INSERT_HPP
