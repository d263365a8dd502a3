/**
 * @file Type.cpp
 * @brief Implementation of tag checks
 */

#include "tomlpath/Type.hpp"

namespace tomlpath {

bool matches(Type expected, const Value& v) noexcept {
    return v.type() == expected;
}

namespace detail {

void check_type(const Value* v, Type expected) {
    if (v != nullptr && !matches(expected, *v)) {
        throw TypeError(type_name(expected), type_name(*v));
    }
}

} // namespace detail

} // namespace tomlpath
