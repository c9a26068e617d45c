#pragma once

/*
    Nested value tree used for structural diffs.

    A Value is a table (string keys, insertion ordered), an array or a
    scalar. Tables compare equal when they hold the same entries, in any
    order. Scalars of different types never compare equal, so Int{1} and
    Float{1.0} differ. A NaN Float equals any other NaN Float.
*/

#include "util/ordered_map.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace patchwork {

enum class ValueShape {
    Map,
    List,
    Scalar,
};

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = int64_t;
    using Float = double;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Array, Int, Float, Bool, String> v;

    ValueShape
    shape() const;

    bool
    contains(const std::string& key) const {
        return is_table() && as_table().contains(key);
    }

    // Find a nested value using e.g. "general.context_lines"
    const Value*
    lookup_value_by_path(std::string_view dotted_path) const;

    // Sets a nested value using e.g. set_value_at("general.context_lines", ...).
    // Missing tables along the path are created. Fails if the path runs
    // into a non-table value.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    bool
    operator==(const Value& other) const;

    bool
    operator!=(const Value& other) const {
        return !(*this == other);
    }

    // clang-format off
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }

    const Array& as_array() const { return std::get<Value::Array>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

// Type tagged single line form, e.g "Integer<5>"
std::string
repr(const Value& v);

//
// Conversion of native values
//

inline Value
to_value(const Value& value) {
    return value;
}

inline Value
to_value(bool value) {
    return Value{Value::Bool{value}};
}

inline Value
to_value(const std::string& value) {
    return Value{Value::String{value}};
}

inline Value
to_value(const char* value) {
    return Value{Value::String{value}};
}

template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
Value
to_value(T value) {
    return Value{Value::Int{static_cast<Value::Int>(value)}};
}

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
Value
to_value(T value) {
    return Value{Value::Float{static_cast<Value::Float>(value)}};
}

template <typename T>
Value
to_value(const std::vector<T>& values);

template <typename T>
Value
to_value(const std::map<std::string, T>& values);

template <typename T>
Value
to_value(const std::vector<T>& values) {
    Value::Array array;
    array.reserve(values.size());
    for (const auto& value : values) {
        array.push_back(to_value(value));
    }
    return Value{std::move(array)};
}

template <typename T>
Value
to_value(const std::map<std::string, T>& values) {
    Value::Table table;
    for (const auto& [key, value] : values) {
        table.insert(key, to_value(value));
    }
    return Value{std::move(table)};
}

}  // namespace patchwork
