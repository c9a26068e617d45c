#include "value_serializer.hpp"

#include <fmt/format.h>

using namespace patchwork;

namespace internal {

std::string
quote_string(const std::string& s) {
    std::string output = "'";
    for (const char c : s) {
        switch (c) {
            case '\\':
                output += "\\\\";
                break;
            case '\'':
                output += "\\'";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                output += c;
        }
    }
    return output + "'";
}

bool
is_bare_key(const std::string& key) {
    if (key.empty() || key == "true" || key == "false" || key == "on" || key == "off") {
        return false;
    }
    const char first = key[0];
    if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z') || first == '_')) {
        return false;
    }
    for (const char c : key) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string
format_key(const std::string& key) {
    return is_bare_key(key) ? key : quote_string(key);
}

std::string
format_float(double value) {
    auto s = fmt::format("{}", value);
    // Keep it a float when read back.
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

void
serialize_obj(const Value& value, std::string& output) {
    if (value.is_table()) {
        const auto& table = value.as_table();
        if (table.empty()) {
            output += "{}";
            return;
        }
        output += "{";
        bool first = true;
        table.for_each([&](const std::string& k, const Value& v) {
            output += first ? "" : ", ";
            output += format_key(k) + " = ";
            serialize_obj(v, output);
            first = false;
        });
        output += "}";
    } else if (value.is_array()) {
        output += "[";
        bool first = true;
        for (const auto& v : value.as_array()) {
            output += first ? "" : ", ";
            serialize_obj(v, output);
            first = false;
        }
        output += "]";
    } else if (value.is_int()) {
        output += fmt::format("{}", value.as_int());
    } else if (value.is_float()) {
        output += format_float(value.as_float());
    } else if (value.is_bool()) {
        output += value.as_bool() ? "true" : "false";
    } else {
        output += quote_string(value.as_string());
    }
}

// A table gets its own [section] when its key can be written in a header.
bool
is_section(const std::string& key, const Value& value) {
    return value.is_table() && is_bare_key(key);
}

void
serialize_section(const std::string& header, const Value& table_value, std::string& output) {
    if (!output.empty()) {
        output += "\n";
    }
    output += "[" + header + "]\n";

    const auto& table = table_value.as_table();
    table.for_each([&](const std::string& k, const Value& v) {
        if (is_section(k, v))
            return;
        output += format_key(k) + " = ";
        serialize_obj(v, output);
        output += "\n";
    });
    table.for_each([&](const std::string& k, const Value& v) {
        if (is_section(k, v)) {
            serialize_section(header + "." + k, v, output);
        }
    });
}

}  // namespace internal

std::string
patchwork::value_serialize(const Value& value) {
    std::string output;
    internal::serialize_obj(value, output);
    return output;
}

std::string
patchwork::value_serialize_document(const Value& value) {
    std::string output;
    const auto& table = value.as_table();

    table.for_each([&](const std::string& k, const Value& v) {
        if (internal::is_section(k, v))
            return;
        output += internal::format_key(k) + " = ";
        internal::serialize_obj(v, output);
        output += "\n";
    });
    table.for_each([&](const std::string& k, const Value& v) {
        if (internal::is_section(k, v)) {
            internal::serialize_section(k, v, output);
        }
    });

    return output;
}
