/**
 * @file Read.hpp
 * @brief Path-string read access into a document
 *
 * Reading follows the resolver rules (see Resolver.hpp):
 * - A missing key or index returns nullptr, not an error
 * - A path that does not fit the document's shape throws a StructureError
 * - A malformed path throws a TokenizeError before the document is touched
 *
 * Typed getters add a presence check and a tag check on top of read():
 * - Nothing at the path → NotAvailable
 * - Wrong tag → TypeError
 */

#ifndef TOMLPATH_READ_HPP
#define TOMLPATH_READ_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Value.hpp"

#include <cstdint>
#include <string>

namespace tomlpath {

/**
 * @brief Read a node using a custom separator
 *
 * @param doc Document root
 * @param path Path like "a/b/[0]"
 * @param separator Path separator
 * @return Pointer to the node, or nullptr if absent
 * @throws TokenizeError if path is malformed
 * @throws StructureError if path does not fit the document
 *
 * Examples:
 * ```cpp
 * Value doc = parse_toml("[table]\n");
 * read_with_separator(doc, "table", '.');       // → Table{}
 * read_with_separator(doc, "table/a", '/');     // → nullptr
 * read_with_separator(doc, "table/[0]", '/');   // throws NoIndexInTable
 * ```
 */
const Value* read_with_separator(const Value& doc, const std::string& path, char separator);

/**
 * @brief Read a node using the default '.' separator
 */
inline const Value* read(const Value& doc, const std::string& path) {
    return read_with_separator(doc, path, kDefaultSeparator);
}

/**
 * @brief Read a node for in-place mutation using a custom separator
 *
 * Same contract as read_with_separator(). The returned pointer allows
 * replacing or mutating the node; the caller must hold exclusive access
 * to @p doc while using it.
 */
Value* read_mut_with_separator(Value& doc, const std::string& path, char separator);

/**
 * @brief Read a node for in-place mutation using the default separator
 */
inline Value* read_mut(Value& doc, const std::string& path) {
    return read_mut_with_separator(doc, path, kDefaultSeparator);
}

/**
 * @brief Check whether a node exists at the path
 *
 * @throws TokenizeError, StructureError as read() does
 */
bool contains(const Value& doc, const std::string& path,
              char separator = kDefaultSeparator);

// ============================================================================
// Typed getters
// ============================================================================

/**
 * @brief Read a String
 * @return Copy of the string at @p path
 * @throws NotAvailable if nothing is at @p path
 * @throws TypeError if the node is not a String
 */
std::string read_string(const Value& doc, const std::string& path,
                        char separator = kDefaultSeparator);

/**
 * @brief Read an Integer
 * @throws NotAvailable, TypeError as read_string()
 */
std::int64_t read_int(const Value& doc, const std::string& path,
                      char separator = kDefaultSeparator);

/**
 * @brief Read a Float
 * @throws NotAvailable, TypeError as read_string()
 */
double read_float(const Value& doc, const std::string& path,
                  char separator = kDefaultSeparator);

/**
 * @brief Read a Boolean
 * @throws NotAvailable, TypeError as read_string()
 */
bool read_bool(const Value& doc, const std::string& path,
               char separator = kDefaultSeparator);

} // namespace tomlpath

#endif // TOMLPATH_READ_HPP
