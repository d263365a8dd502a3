/**
 * @file Value.hpp
 * @brief Document value model for TOML-shaped configuration data
 *
 * A Value is a closed tagged union with exactly seven kinds:
 * - String (std::string, UTF-8)
 * - Integer (int64_t)
 * - Float (double)
 * - Boolean (true | false)
 * - Datetime (opaque TOML date/time text)
 * - Array ([Value, ...])
 * - Table ({String: Value, ...})
 *
 * The tag of a Value is fixed by construction. Containers may be mutated
 * in place (entries replaced, appended, erased) without changing their tag.
 */

#ifndef TOMLPATH_VALUE_HPP
#define TOMLPATH_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tomlpath {

/**
 * @brief Tag of a Value
 *
 * Mirrors the seven alternatives of the document model one to one.
 */
enum class Type {
    String,
    Integer,
    Float,
    Boolean,
    Datetime,
    Array,
    Table
};

/**
 * @brief Opaque TOML date, time or date-time
 *
 * Holds the literal text (e.g. "1979-05-27T07:32:00Z", "07:32:00",
 * "1979-05-27"). Only the format layer interprets it.
 */
struct Datetime {
    std::string text;

    bool operator==(const Datetime& other) const { return text == other.text; }
    bool operator!=(const Datetime& other) const { return text != other.text; }
};

class Value;

/// Ordered sequence of values
using Array = std::vector<Value>;

/// String-keyed mapping of values; keys are unique
using Table = std::map<std::string, Value>;

/**
 * @brief A node of a configuration document
 *
 * Examples:
 * ```cpp
 * Value doc = Value::table();
 * doc.as_table()->emplace("port", 8080);
 * doc.as_table()->emplace("hosts", Array{"a", "b"});
 * doc.type();              // Type::Table
 * (*doc.as_table())["port"].is_integer();  // true
 * ```
 */
class Value {
public:
    using Storage = std::variant<std::string, std::int64_t, double, bool,
                                 Datetime, Array, Table>;

    /// An empty Table (a document root)
    Value() : data_(std::in_place_type<Table>) {}

    Value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}
    Value(const char* s) : data_(std::in_place_type<std::string>, s) {}

    /// Pointers other than C strings are not values (no pointer-to-bool)
    template <typename T>
    Value(T*) = delete;
    Value(std::nullptr_t) = delete;

    /// Any integer type except bool; stored as int64 (unsigned values wrap)
    template <typename T,
              std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
    Value(T i) : data_(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(i)) {}

    Value(double f) : data_(std::in_place_type<double>, f) {}

    /// Exactly bool
    template <typename T, std::enable_if_t<std::is_same<T, bool>::value, int> = 0>
    Value(T b) : data_(std::in_place_type<bool>, b) {}
    Value(Datetime d) : data_(std::in_place_type<Datetime>, std::move(d)) {}
    Value(Array a) : data_(std::in_place_type<Array>, std::move(a)) {}
    Value(Table t) : data_(std::in_place_type<Table>, std::move(t)) {}

    static Value table() { return Value(Table{}); }
    static Value array() { return Value(Array{}); }

    /**
     * @brief Get the tag of this value
     */
    Type type() const noexcept;

    bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    bool is_float() const noexcept { return std::holds_alternative<double>(data_); }
    bool is_boolean() const noexcept { return std::holds_alternative<bool>(data_); }
    bool is_datetime() const noexcept { return std::holds_alternative<Datetime>(data_); }
    bool is_array() const noexcept { return std::holds_alternative<Array>(data_); }
    bool is_table() const noexcept { return std::holds_alternative<Table>(data_); }

    /// True for Array and Table
    bool is_container() const noexcept { return is_array() || is_table(); }

    // Checked payload access: nullptr when the tag differs
    const std::string* as_string() const noexcept { return std::get_if<std::string>(&data_); }
    std::string* as_string() noexcept { return std::get_if<std::string>(&data_); }
    const std::int64_t* as_integer() const noexcept { return std::get_if<std::int64_t>(&data_); }
    std::int64_t* as_integer() noexcept { return std::get_if<std::int64_t>(&data_); }
    const double* as_float() const noexcept { return std::get_if<double>(&data_); }
    double* as_float() noexcept { return std::get_if<double>(&data_); }
    const bool* as_boolean() const noexcept { return std::get_if<bool>(&data_); }
    bool* as_boolean() noexcept { return std::get_if<bool>(&data_); }
    const Datetime* as_datetime() const noexcept { return std::get_if<Datetime>(&data_); }
    Datetime* as_datetime() noexcept { return std::get_if<Datetime>(&data_); }
    const Array* as_array() const noexcept { return std::get_if<Array>(&data_); }
    Array* as_array() noexcept { return std::get_if<Array>(&data_); }
    const Table* as_table() const noexcept { return std::get_if<Table>(&data_); }
    Table* as_table() noexcept { return std::get_if<Table>(&data_); }

    const Storage& storage() const noexcept { return data_; }

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Storage data_;
};

/**
 * @brief Get human-readable name of a tag
 * @return "String", "Integer", "Float", "Boolean", "Datetime", "Array"
 *         or "Table"
 */
const char* type_name(Type t) noexcept;

/**
 * @brief Get human-readable name of a value's tag
 */
inline const char* type_name(const Value& val) noexcept {
    return type_name(val.type());
}

} // namespace tomlpath

#endif // TOMLPATH_VALUE_HPP
