#pragma once

/*
    Structural diff of nested values.

    The change tree only holds the paths that differ:

        Added{value}         key/index only present in the new value
        Removed{value}       key/index only present in the old value
        Modified{old, new}   scalars differ, or the shapes differ
        Nested{key: change}  changes below a table key or array index

    Two equal values give an empty Nested. Arrays are compared position by
    position; elements past the end of the shorter array are Added or
    Removed.
*/

#include "processing/conflict.hpp"
#include "structural/value.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace patchwork {

// Table key or array index
using PathKey = std::variant<std::string, std::size_t>;
using Path = std::vector<PathKey>;

struct StructuralChange;

struct Added {
    Value value;

    bool
    operator==(const Added& other) const {
        return value == other.value;
    }
};

struct Removed {
    Value value;

    bool
    operator==(const Removed& other) const {
        return value == other.value;
    }
};

struct Modified {
    Value old_value;
    Value new_value;

    bool
    operator==(const Modified& other) const {
        return old_value == other.old_value && new_value == other.new_value;
    }
};

using Nested = std::map<PathKey, StructuralChange>;

struct StructuralChange {
    std::variant<Added, Removed, Modified, Nested> change;

    static StructuralChange
    added(Value value) {
        return {Added{std::move(value)}};
    }

    static StructuralChange
    removed(Value value) {
        return {Removed{std::move(value)}};
    }

    static StructuralChange
    modified(Value old_value, Value new_value) {
        return {Modified{std::move(old_value), std::move(new_value)}};
    }

    static StructuralChange
    nested(Nested entries) {
        return {std::move(entries)};
    }

    // Equal values; an empty Nested
    bool
    is_no_change() const;

    // clang-format off
    bool is_added() const { return std::holds_alternative<Added>(change); }
    bool is_removed() const { return std::holds_alternative<Removed>(change); }
    bool is_modified() const { return std::holds_alternative<Modified>(change); }
    bool is_nested() const { return std::holds_alternative<Nested>(change); }

    const Added& as_added() const { return std::get<Added>(change); }
    const Removed& as_removed() const { return std::get<Removed>(change); }
    const Modified& as_modified() const { return std::get<Modified>(change); }
    const Nested& as_nested() const { return std::get<Nested>(change); }
    // clang-format on

    bool
    operator==(const StructuralChange& other) const;
};

struct StructuralApplyResult {
    ApplyStatus status = ApplyStatus::OK;
    Value value;
    ConflictError conflict;

    bool
    is_ok() const {
        return status == ApplyStatus::OK;
    }
};

StructuralChange
structural_diff(const Value& old_value, const Value& new_value);

// Apply `change` to a copy of `old_value`. Removed and Modified entries
// must match what is currently stored, or the application fails and no
// value is returned.
StructuralApplyResult
structural_apply(const Value& old_value, const StructuralChange& change);

// One line per leaf change:
//
//     + servers[2] = {port = 80}
//     - name = 'old'
//     ~ general.context_lines: 3 -> 5
std::string
structural_change_render(const StructuralChange& change);

// "servers[2].port"; "." for the root
std::string
path_render(const Path& path);

}  // namespace patchwork
