/**
 * @file Value.cpp
 * @brief Implementation of the document value model
 */

#include "tomlpath/Value.hpp"

namespace tomlpath {

Type Value::type() const noexcept {
    switch (data_.index()) {
        case 0: return Type::String;
        case 1: return Type::Integer;
        case 2: return Type::Float;
        case 3: return Type::Boolean;
        case 4: return Type::Datetime;
        case 5: return Type::Array;
        default: return Type::Table;
    }
}

bool operator==(const Value& a, const Value& b) {
    return a.data_ == b.data_;
}

const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::String:   return "String";
        case Type::Integer:  return "Integer";
        case Type::Float:    return "Float";
        case Type::Boolean:  return "Boolean";
        case Type::Datetime: return "Datetime";
        case Type::Array:    return "Array";
        case Type::Table:    return "Table";
    }
    return "unknown";
}

} // namespace tomlpath
