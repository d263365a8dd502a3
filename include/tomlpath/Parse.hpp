/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for command line input
 *
 * Parsing order (first match wins):
 * - V1: Boolean ("true", "false" - case insensitive)
 * - V2: Integer (matches ^[+-]?[0-9]+$ and fits in int64)
 * - V3: Float (decimal point or exponent; also inf, +inf, -inf, nan)
 * - V4: Datetime (TOML date, time or date-time literal)
 * - V5: Inline TOML array or table ([...] or {...})
 * - V6: Quoted String ("..." with TOML escapes)
 * - V7: Raw String (fallback)
 *
 * There is no null rule; TOML has no null.
 */

#ifndef TOMLPATH_PARSE_HPP
#define TOMLPATH_PARSE_HPP

#include "tomlpath/Value.hpp"

#include <string>

namespace tomlpath {

/**
 * @brief Parse string value to appropriate type
 *
 * @param str Input string to parse
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")              // → true (Boolean)
 * parse_value("-17")               // → -17 (Integer)
 * parse_value("2.5e3")             // → 2500.0 (Float)
 * parse_value("1979-05-27")        // → Datetime "1979-05-27"
 * parse_value("[1, 2]")            // → [1, 2] (Array)
 * parse_value("{ a = 1 }")         // → {a = 1} (Table)
 * parse_value("\"a\\tb\"")         // → "a<TAB>b" (String, unquoted)
 * parse_value("hello")             // → "hello" (String)
 * ```
 */
Value parse_value(const std::string& str);

} // namespace tomlpath

#endif // TOMLPATH_PARSE_HPP
