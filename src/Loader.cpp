/**
 * @file Loader.cpp
 * @brief TOML bridge implementation (toml++)
 */

#include "tomlpath/Loader.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace tomlpath {

namespace {

// ============================================================================
// toml++ → Value
// ============================================================================

/**
 * @brief Stream a toml++ value to its TOML text
 */
template <typename T>
std::string toml_text(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Value from_node(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(static_cast<std::int64_t>(node.as_integer()->get()));

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(Datetime{toml_text(node.as_date()->get())});

        case toml::node_type::time:
            return Value(Datetime{toml_text(node.as_time()->get())});

        case toml::node_type::date_time:
            return Value(Datetime{toml_text(node.as_date_time()->get())});

        case toml::node_type::array: {
            Array arr;
            for (const auto& elem : *node.as_array()) {
                arr.push_back(from_node(elem));
            }
            return Value(std::move(arr));
        }

        case toml::node_type::table: {
            Table tbl;
            for (const auto& [key, val] : *node.as_table()) {
                tbl.emplace(std::string(key.str()), from_node(val));
            }
            return Value(std::move(tbl));
        }

        default:
            break;
    }
    throw DocumentError("Unsupported TOML node type");
}

// ============================================================================
// Value → toml++ (value-based construction)
// ============================================================================

toml::array make_array(const Array& a);
toml::table make_table(const Table& t);

/**
 * @brief Hand a Datetime back to toml++ as its native date/time type
 *
 * Text toml++ does not accept as a date/time is kept as a string.
 */
template <typename Sink>
void emit_datetime(const std::string& text, Sink& sink) {
    toml::table probe;
    try {
        probe = toml::parse("v = " + text);
    } catch (const toml::parse_error&) {
        sink(text);
        return;
    }

    const toml::node* node = probe.get("v");
    if (node == nullptr) {
        sink(text);
    } else if (auto d = node->as_date()) {
        sink(d->get());
    } else if (auto t = node->as_time()) {
        sink(t->get());
    } else if (auto dt = node->as_date_time()) {
        sink(dt->get());
    } else {
        sink(text);
    }
}

/**
 * @brief Convert a Value and pass the toml++ result to @p sink
 *
 * The sink decides where the converted value goes (table entry, array
 * element).
 */
template <typename Sink>
void emit(const Value& v, Sink&& sink) {
    switch (v.type()) {
        case Type::String:   sink(*v.as_string()); break;
        case Type::Integer:  sink(*v.as_integer()); break;
        case Type::Float:    sink(*v.as_float()); break;
        case Type::Boolean:  sink(*v.as_boolean()); break;
        case Type::Datetime: emit_datetime(v.as_datetime()->text, sink); break;
        case Type::Array:    sink(make_array(*v.as_array())); break;
        case Type::Table:    sink(make_table(*v.as_table())); break;
    }
}

toml::array make_array(const Array& a) {
    toml::array out;
    for (const auto& elem : a) {
        emit(elem, [&](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
    }
    return out;
}

toml::table make_table(const Table& t) {
    toml::table out;
    for (const auto& entry : t) {
        const std::string& key = entry.first;
        emit(entry.second, [&](auto&& x) { out.insert_or_assign(key, std::forward<decltype(x)>(x)); });
    }
    return out;
}

toml::table make_root(const Value& doc) {
    if (const Table* t = doc.as_table()) {
        return make_table(*t);
    }
    toml::table root;
    emit(doc, [&](auto&& x) { root.insert_or_assign("value", std::forward<decltype(x)>(x)); });
    return root;
}

/**
 * @brief Stream a concrete toml++ node type (table/array/value)
 */
void stream_toml_node(std::ostream& os, const toml::node& n) {
    if (auto t = n.as_table()) { os << *t; return; }
    if (auto a = n.as_array()) { os << *a; return; }
    if (auto v = n.as_string()) { os << *v; return; }
    if (auto v = n.as_integer()) { os << *v; return; }
    if (auto v = n.as_floating_point()) { os << *v; return; }
    if (auto v = n.as_boolean()) { os << *v; return; }
    if (auto v = n.as_date()) { os << *v; return; }
    if (auto v = n.as_time()) { os << *v; return; }
    if (auto v = n.as_date_time()) { os << *v; return; }
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

Value parse_toml(std::string_view text, std::string_view source) {
    toml::table table;
    try {
        table = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            std::string(source),
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return from_node(table);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return from_node(table);
}

// ============================================================================
// Printing
// ============================================================================

std::string to_toml_string(const Value& doc) {
    std::ostringstream oss;
    oss << make_root(doc);
    return oss.str();
}

std::string to_toml_value_string(const Value& v) {
    if (v.is_table()) {
        return to_toml_string(v);
    }

    toml::array holder;
    emit(v, [&](auto&& x) { holder.push_back(std::forward<decltype(x)>(x)); });

    std::ostringstream oss;
    stream_toml_node(oss, *holder.get(0));
    return oss.str();
}

void save_toml_file(const std::string& path, const Value& doc) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw DocumentError("Failed to open for write: " + path);
    }
    ofs << to_toml_string(doc);
}

} // namespace tomlpath
