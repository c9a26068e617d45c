#include "value.hpp"

#include <fmt/format.h>

#include <cmath>
#include <tuple>

using namespace patchwork;

namespace internal {

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, "");
    }

    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

}  // namespace internal

ValueShape
Value::shape() const {
    if (is_table())
        return ValueShape::Map;
    if (is_array())
        return ValueShape::List;
    return ValueShape::Scalar;
}

bool
Value::operator==(const Value& other) const {
    // NaN equals NaN, so that a value always equals itself.
    if (is_float() && other.is_float()) {
        const auto a = std::get<Float>(v);
        const auto b = std::get<Float>(other.v);
        return a == b || (std::isnan(a) && std::isnan(b));
    }
    return v == other.v;
}

const Value*
Value::lookup_value_by_path(std::string_view dotted_path) const {
    const Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        if (!result_value->is_table()) {
            return nullptr;
        }
        result_value = result_value->as_table().find(std::string{head});
        if (result_value == nullptr) {
            return nullptr;
        }
        remaining = rest;
    }
    return result_value;
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    while (true) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (key.empty() || !iter->is_table()) {
            return false;
        }

        auto& table = iter->as_table();
        if (rest.empty()) {
            table.insert(key, std::move(value));
            return true;
        }

        if (!table.contains(key)) {
            table.insert(key, Value{Value::Table{}});
        }
        iter = &table[key];
        remaining = rest;
    }
}

std::string
patchwork::repr(const Value& v) {
    if (v.is_table()) {
        return fmt::format("Table<{}>", v.as_table().size());
    } else if (v.is_array()) {
        return fmt::format("Array<{}>", v.as_array().size());
    } else if (v.is_int()) {
        return fmt::format("Integer<{}>", v.as_int());
    } else if (v.is_float()) {
        return fmt::format("Float<{}>", v.as_float());
    } else if (v.is_bool()) {
        return fmt::format("Boolean<{}>", v.as_bool());
    } else {
        return fmt::format("String<'{}'>", v.as_string());
    }
}
