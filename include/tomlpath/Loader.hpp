/**
 * @file Loader.hpp
 * @brief TOML text and file bridge (toml++)
 *
 * Converts between TOML text and the Value model:
 * - TOML tables and arrays map to Table and Array
 * - TOML date, time and date-time all map to Datetime (their TOML text)
 * - Every other TOML type maps to the Value kind of the same name
 *
 * Printing goes the other way; a Datetime's text is handed back to toml++
 * so it is written as a native date/time, or as a string if toml++ does
 * not accept it.
 */

#ifndef TOMLPATH_LOADER_HPP
#define TOMLPATH_LOADER_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Value.hpp"

#include <string>
#include <string_view>

namespace tomlpath {

// ============================================================================
// Parsing
// ============================================================================

/**
 * @brief Parse TOML text into a Table value
 *
 * @param text TOML document text
 * @param source Name used in error messages (e.g. a file path)
 * @return Root Table of the document
 * @throws DocumentParseError if the text is not valid TOML
 *
 * Examples:
 * ```cpp
 * Value doc = parse_toml("[a.b.c]\n");
 * Value doc2 = parse_toml("x = [1, 2]\nwhen = 1979-05-27\n");
 * ```
 */
Value parse_toml(std::string_view text, std::string_view source = "string");

/**
 * @brief Load a TOML file into a Table value
 *
 * @param path Path to the TOML file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Printing
// ============================================================================

/**
 * @brief Print a document as TOML
 *
 * A non-Table root is wrapped as `value = ...` since TOML documents are
 * tables.
 */
std::string to_toml_string(const Value& doc);

/**
 * @brief Print a single value in TOML syntax
 *
 * Tables print as a document, everything else as an inline TOML value
 * (e.g. `"text"`, `42`, `[ 1, 2 ]`, `1979-05-27`).
 */
std::string to_toml_value_string(const Value& v);

/**
 * @brief Write a document to a TOML file
 *
 * @throws DocumentError if the file cannot be opened for writing
 */
void save_toml_file(const std::string& path, const Value& doc);

} // namespace tomlpath

#endif // TOMLPATH_LOADER_HPP
