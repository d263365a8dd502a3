/**
 * @file Read.cpp
 * @brief Implementation of path reads and typed getters
 */

#include "tomlpath/Read.hpp"
#include "tomlpath/Resolver.hpp"
#include "tomlpath/Type.hpp"

namespace tomlpath {

const Value* read_with_separator(const Value& doc, const std::string& path, char separator) {
    const TokenChain tokens = tokenize(path, separator);
    return resolve(doc, tokens, separator);
}

Value* read_mut_with_separator(Value& doc, const std::string& path, char separator) {
    const TokenChain tokens = tokenize(path, separator);
    return resolve_mut(doc, tokens, separator);
}

bool contains(const Value& doc, const std::string& path, char separator) {
    return read_with_separator(doc, path, separator) != nullptr;
}

namespace {
    /**
     * @brief Read and check presence and tag in one go
     */
    const Value& read_typed(const Value& doc, const std::string& path,
                            char separator, Type expected) {
        const Value* found = read_with_separator(doc, path, separator);
        if (found == nullptr) {
            throw NotAvailable(path);
        }
        return as_type(*found, expected);
    }
}

std::string read_string(const Value& doc, const std::string& path, char separator) {
    return *read_typed(doc, path, separator, Type::String).as_string();
}

std::int64_t read_int(const Value& doc, const std::string& path, char separator) {
    return *read_typed(doc, path, separator, Type::Integer).as_integer();
}

double read_float(const Value& doc, const std::string& path, char separator) {
    return *read_typed(doc, path, separator, Type::Float).as_float();
}

bool read_bool(const Value& doc, const std::string& path, char separator) {
    return *read_typed(doc, path, separator, Type::Boolean).as_boolean();
}

} // namespace tomlpath
