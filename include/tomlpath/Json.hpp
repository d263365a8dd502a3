/**
 * @file Json.hpp
 * @brief JSON rendering of document values (nlohmann::json)
 *
 * Used for tool output. Table becomes an object, Array an array, Datetime
 * its TOML text; the remaining kinds map to the JSON scalar of the same
 * kind.
 */

#ifndef TOMLPATH_JSON_HPP
#define TOMLPATH_JSON_HPP

#include "tomlpath/Value.hpp"

#include <nlohmann/json.hpp>

namespace tomlpath {

/**
 * @brief Convert a Value to nlohmann::json
 *
 * Examples:
 * ```cpp
 * to_json(parse_toml("a = 1\nb = [true]\n"));  // {"a": 1, "b": [true]}
 * to_json(Datetime{"1979-05-27"});             // "1979-05-27"
 * ```
 */
nlohmann::json to_json(const Value& v);

} // namespace tomlpath

#endif // TOMLPATH_JSON_HPP
