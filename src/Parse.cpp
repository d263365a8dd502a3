/**
 * @file Parse.cpp
 * @brief Implementation of value literal parsing
 */

#include "tomlpath/Parse.hpp"
#include "tomlpath/Errors.hpp"
#include "tomlpath/Loader.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <regex>
#include <stdexcept>

namespace tomlpath {

namespace {
    /**
     * @brief Convert string to lowercase
     */
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::string& pattern) {
        return std::regex_match(str, std::regex(pattern));
    }

    /**
     * @brief Let toml++ read @p literal as the right-hand side of a key
     * @return The parsed value, or std::nullopt if it is not a TOML value
     */
    std::optional<Value> parse_toml_literal(const std::string& literal) {
        Value probe;
        try {
            probe = parse_toml("v = " + literal);
        } catch (const DocumentParseError&) {
            return std::nullopt;
        }

        // Anything besides "v" means the literal spilled into more TOML
        auto* table = probe.as_table();
        auto found = table->find("v");
        if (found == table->end() || table->size() != 1) {
            return std::nullopt;
        }
        return std::move(found->second);
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return std::string(); // V7: empty string stays as string
    }

    // V1: Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // V2: Integer
    if (matches_regex(str, "^[+-]?[0-9]+$")) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64: falls through to the string rules
        }
    }

    // V3: Float
    if (lower == "inf" || lower == "+inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (lower == "-inf") {
        return -std::numeric_limits<double>::infinity();
    }
    if (lower == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (str.find_first_of(".eE") != std::string::npos &&
        matches_regex(str, "^[+-]?[0-9]+(\\.[0-9]+)?([eE][+-]?[0-9]+)?$")) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Overflowing exponent: falls through
        }
    }

    // V4: Datetime
    if (matches_regex(str, "^[0-9]{4}-[0-9]{2}-[0-9]{2}([Tt ].*)?$") ||
        matches_regex(str, "^[0-9]{2}:[0-9]{2}(:[0-9]{2}.*)?$")) {
        auto parsed = parse_toml_literal(str);
        if (parsed && parsed->is_datetime()) {
            return std::move(*parsed);
        }
    }

    // V5: Inline array or table
    if ((str.front() == '[' && str.back() == ']') ||
        (str.front() == '{' && str.back() == '}')) {
        auto parsed = parse_toml_literal(str);
        if (parsed && parsed->is_container()) {
            return std::move(*parsed);
        }
    }

    // V6: Quoted String
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        auto parsed = parse_toml_literal(str);
        if (parsed && parsed->is_string()) {
            return std::move(*parsed);
        }
    }

    // V7: Raw String (fallback)
    return str;
}

} // namespace tomlpath
