/**
 * @file Json.cpp
 * @brief Implementation of JSON rendering
 */

#include "tomlpath/Json.hpp"

namespace tomlpath {

nlohmann::json to_json(const Value& v) {
    using nlohmann::json;

    switch (v.type()) {
        case Type::String:
            return json(*v.as_string());

        case Type::Integer:
            return json(*v.as_integer());

        case Type::Float:
            return json(*v.as_float());

        case Type::Boolean:
            return json(*v.as_boolean());

        case Type::Datetime:
            return json(v.as_datetime()->text);

        case Type::Array: {
            json arr = json::array();
            for (const auto& elem : *v.as_array()) {
                arr.push_back(to_json(elem));
            }
            return arr;
        }

        case Type::Table: {
            json obj = json::object();
            for (const auto& [key, val] : *v.as_table()) {
                obj[key] = to_json(val);
            }
            return obj;
        }
    }
    return json();
}

} // namespace tomlpath
