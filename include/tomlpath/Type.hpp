/**
 * @file Type.hpp
 * @brief Tag checks and conversions of resolved values
 *
 * Two independent tools:
 *
 * - as_type(result, expected) re-validates the tag of a resolution result
 *   of any shape: an owned Value, a Value reference, an optional owned
 *   value (std::optional<Value>) or an optional reference (Value pointer).
 *   A match passes the result through unchanged, a mismatch throws
 *   TypeError(expected, actual) and absence (nullptr / std::nullopt) is
 *   passed through, since absence is not a type error.
 *
 * - from_value<T>(value) recursively converts an owned Value into a native
 *   shape: bool, std::int64_t, double, std::string, Datetime, Value,
 *   std::vector<T> and std::map<std::string, T> (nesting allowed). The
 *   first mismatching element aborts the conversion with TypeError.
 */

#ifndef TOMLPATH_TYPE_HPP
#define TOMLPATH_TYPE_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tomlpath {

/**
 * @brief Check whether a value carries the given tag
 */
bool matches(Type expected, const Value& v) noexcept;

namespace detail {

inline const Value* peek(const Value& v) noexcept { return &v; }
inline const Value* peek(const Value* v) noexcept { return v; }
inline const Value* peek(const std::optional<Value>& v) noexcept {
    return v.has_value() ? &*v : nullptr;
}

/**
 * @brief Throw TypeError unless @p v is absent or carries @p expected
 */
void check_type(const Value* v, Type expected);

} // namespace detail

/// Result shape of as_type(): lvalues stay references, rvalues are returned by value
template <typename Result>
using AsTypeResult = std::conditional_t<std::is_lvalue_reference<Result>::value,
                                        Result, std::remove_cv_t<Result>>;

/**
 * @brief Validate the tag of a resolution result
 *
 * @param result Value, Value&, std::optional<Value> or Value pointer
 * @param expected Expected tag
 * @return @p result unchanged
 * @throws TypeError if a present value carries another tag
 *
 * Examples:
 * ```cpp
 * const Value* port = as_type(read(doc, "server.port"), Type::Integer);
 * std::optional<Value> old = as_type(insert(doc, "a", 1), Type::String);
 * const Value& t = as_type(*read(doc, "server"), Type::Table);
 * ```
 */
template <typename Result>
AsTypeResult<Result> as_type(Result&& result, Type expected) {
    detail::check_type(detail::peek(result), expected);
    return std::forward<Result>(result);
}

// ============================================================================
// Generic conversion
// ============================================================================

/**
 * @brief Conversion of an owned Value into T
 *
 * Specialize with a static `T convert(Value v)` to support more targets.
 */
template <typename T, typename Enable = void>
struct FromValue;

template <>
struct FromValue<Value> {
    static Value convert(Value v) { return v; }
};

template <>
struct FromValue<bool> {
    static bool convert(Value v) {
        detail::check_type(&v, Type::Boolean);
        return *v.as_boolean();
    }
};

template <>
struct FromValue<std::int64_t> {
    static std::int64_t convert(Value v) {
        detail::check_type(&v, Type::Integer);
        return *v.as_integer();
    }
};

template <>
struct FromValue<double> {
    static double convert(Value v) {
        detail::check_type(&v, Type::Float);
        return *v.as_float();
    }
};

template <>
struct FromValue<std::string> {
    static std::string convert(Value v) {
        detail::check_type(&v, Type::String);
        return std::move(*v.as_string());
    }
};

template <>
struct FromValue<Datetime> {
    static Datetime convert(Value v) {
        detail::check_type(&v, Type::Datetime);
        return std::move(*v.as_datetime());
    }
};

template <typename T>
struct FromValue<std::vector<T>> {
    static std::vector<T> convert(Value v) {
        detail::check_type(&v, Type::Array);
        std::vector<T> out;
        out.reserve(v.as_array()->size());
        for (auto& elem : *v.as_array()) {
            out.push_back(FromValue<T>::convert(std::move(elem)));
        }
        return out;
    }
};

template <typename T>
struct FromValue<std::map<std::string, T>> {
    static std::map<std::string, T> convert(Value v) {
        detail::check_type(&v, Type::Table);
        std::map<std::string, T> out;
        for (auto& [key, elem] : *v.as_table()) {
            out.emplace(key, FromValue<T>::convert(std::move(elem)));
        }
        return out;
    }
};

/**
 * @brief Convert an owned Value into a native shape
 *
 * @throws TypeError on the first tag mismatch, at any depth
 *
 * Examples:
 * ```cpp
 * auto ports = from_value<std::vector<std::int64_t>>(*read(doc, "ports"));
 * auto env = from_value<std::map<std::string, std::string>>(*read(doc, "env"));
 * from_value<std::vector<std::int64_t>>(Array{1, "x"});  // throws TypeError
 * ```
 */
template <typename T>
T from_value(Value v) {
    return FromValue<T>::convert(std::move(v));
}

} // namespace tomlpath

#endif // TOMLPATH_TYPE_HPP
