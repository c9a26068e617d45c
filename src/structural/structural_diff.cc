#include "structural_diff.hpp"

#include "structural/value_serializer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

using namespace patchwork;

namespace {

StructuralChange
diff_value(const Value& old_value, const Value& new_value);

StructuralChange
diff_table(const Value::Table& old_table, const Value::Table& new_table) {
    Nested entries;
    old_table.for_each([&](const std::string& key, const Value& old_child) {
        const Value* new_child = new_table.find(key);
        if (new_child == nullptr) {
            entries.emplace(key, StructuralChange::removed(old_child));
            return;
        }
        auto change = diff_value(old_child, *new_child);
        if (!change.is_no_change()) {
            entries.emplace(key, std::move(change));
        }
    });
    new_table.for_each([&](const std::string& key, const Value& new_child) {
        if (!old_table.contains(key)) {
            entries.emplace(key, StructuralChange::added(new_child));
        }
    });
    return StructuralChange::nested(std::move(entries));
}

StructuralChange
diff_array(const Value::Array& old_array, const Value::Array& new_array) {
    Nested entries;
    const auto common = std::min(old_array.size(), new_array.size());
    for (std::size_t i = 0; i < common; i++) {
        auto change = diff_value(old_array[i], new_array[i]);
        if (!change.is_no_change()) {
            entries.emplace(i, std::move(change));
        }
    }
    for (std::size_t i = common; i < old_array.size(); i++) {
        entries.emplace(i, StructuralChange::removed(old_array[i]));
    }
    for (std::size_t i = common; i < new_array.size(); i++) {
        entries.emplace(i, StructuralChange::added(new_array[i]));
    }
    return StructuralChange::nested(std::move(entries));
}

StructuralChange
diff_value(const Value& old_value, const Value& new_value) {
    if (old_value.is_table() && new_value.is_table()) {
        return diff_table(old_value.as_table(), new_value.as_table());
    }
    if (old_value.is_array() && new_value.is_array()) {
        return diff_array(old_value.as_array(), new_value.as_array());
    }
    if (old_value == new_value) {
        return StructuralChange::nested({});
    }
    return StructuralChange::modified(old_value, new_value);
}

//
// Apply
//

struct Applier {
    Path path;
    std::optional<ConflictError> conflict;

    bool
    fail(const std::string& message) {
        ConflictError error;
        error.location = path_render(path);
        error.message = message;
        conflict = std::move(error);
        return false;
    }

    bool
    apply(Value& target, const StructuralChange& change) {
        if (change.is_added()) {
            return fail("value already exists");
        }
        if (change.is_removed()) {
            return fail("cannot remove a value from its own position");
        }
        if (change.is_modified()) {
            const auto& modified = change.as_modified();
            if (target != modified.old_value) {
                return fail(fmt::format("expected {}, found {}", value_serialize(modified.old_value),
                                        value_serialize(target)));
            }
            target = modified.new_value;
            return true;
        }

        const auto& entries = change.as_nested();
        if (entries.empty()) {
            return true;
        }
        if (target.is_table()) {
            return apply_table(target.as_table(), entries);
        }
        if (target.is_array()) {
            return apply_array(target.as_array(), entries);
        }
        return fail(fmt::format("cannot apply nested changes to {}", value_serialize(target)));
    }

    bool
    apply_table(Value::Table& table, const Nested& entries) {
        for (const auto& [key, change] : entries) {
            if (!std::holds_alternative<std::string>(key)) {
                return fail("expected a table key, found an array index");
            }
            const auto& name = std::get<std::string>(key);
            path.push_back(key);

            Value* current = table.find(name);
            if (change.is_added()) {
                if (current != nullptr) {
                    return fail("key already exists");
                }
                table.insert(name, change.as_added().value);
            } else if (change.is_removed()) {
                if (current == nullptr) {
                    return fail("key does not exist");
                }
                if (*current != change.as_removed().value) {
                    return fail(fmt::format("expected {}, found {}", value_serialize(change.as_removed().value),
                                            value_serialize(*current)));
                }
                table.remove(name);
            } else {
                if (current == nullptr) {
                    return fail("key does not exist");
                }
                if (!apply(*current, change)) {
                    return false;
                }
            }

            path.pop_back();
        }
        return true;
    }

    // Position edits first, then removals from the back, then additions
    // in ascending order; the indices of each step refer to the array as
    // left by the previous one.
    bool
    apply_array(Value::Array& array, const Nested& entries) {
        std::vector<std::pair<std::size_t, const StructuralChange*>> removals;
        std::vector<std::pair<std::size_t, const StructuralChange*>> additions;

        for (const auto& [key, change] : entries) {
            if (!std::holds_alternative<std::size_t>(key)) {
                return fail("expected an array index, found a table key");
            }
            const auto index = std::get<std::size_t>(key);
            if (change.is_removed()) {
                removals.emplace_back(index, &change);
                continue;
            }
            if (change.is_added()) {
                additions.emplace_back(index, &change);
                continue;
            }

            path.push_back(key);
            if (index >= array.size()) {
                return fail(fmt::format("index out of range; array has {} elements", array.size()));
            }
            if (!apply(array[index], change)) {
                return false;
            }
            path.pop_back();
        }

        // `entries` is ordered by index; walk removals backwards.
        for (auto it = removals.rbegin(); it != removals.rend(); ++it) {
            const auto [index, change] = *it;
            path.push_back(index);
            if (index >= array.size()) {
                return fail(fmt::format("index out of range; array has {} elements", array.size()));
            }
            const auto& expected = change->as_removed().value;
            if (array[index] != expected) {
                return fail(fmt::format("expected {}, found {}", value_serialize(expected),
                                        value_serialize(array[index])));
            }
            array.erase(array.begin() + static_cast<std::ptrdiff_t>(index));
            path.pop_back();
        }

        for (const auto& [index, change] : additions) {
            path.push_back(index);
            if (index > array.size()) {
                return fail(fmt::format("cannot add at index {}; array has {} elements", index, array.size()));
            }
            array.insert(array.begin() + static_cast<std::ptrdiff_t>(index), change->as_added().value);
            path.pop_back();
        }

        return true;
    }
};

//
// Render
//

void
render_change(const StructuralChange& change, Path& path, std::string& output) {
    if (change.is_added()) {
        output += fmt::format("+ {} = {}\n", path_render(path), value_serialize(change.as_added().value));
    } else if (change.is_removed()) {
        output += fmt::format("- {} = {}\n", path_render(path), value_serialize(change.as_removed().value));
    } else if (change.is_modified()) {
        const auto& modified = change.as_modified();
        output += fmt::format("~ {}: {} -> {}\n", path_render(path), value_serialize(modified.old_value),
                              value_serialize(modified.new_value));
    } else {
        for (const auto& [key, child] : change.as_nested()) {
            path.push_back(key);
            render_change(child, path, output);
            path.pop_back();
        }
    }
}

}  // namespace

bool
StructuralChange::is_no_change() const {
    return is_nested() && as_nested().empty();
}

bool
StructuralChange::operator==(const StructuralChange& other) const {
    return change == other.change;
}

StructuralChange
patchwork::structural_diff(const Value& old_value, const Value& new_value) {
    return diff_value(old_value, new_value);
}

StructuralApplyResult
patchwork::structural_apply(const Value& old_value, const StructuralChange& change) {
    StructuralApplyResult result;

    Value value = old_value;
    Applier applier;
    if (!applier.apply(value, change)) {
        result.status = ApplyStatus::Conflict;
        result.conflict = std::move(*applier.conflict);
        return result;
    }

    result.value = std::move(value);
    return result;
}

std::string
patchwork::structural_change_render(const StructuralChange& change) {
    std::string output;
    Path path;
    render_change(change, path, output);
    return output;
}

std::string
patchwork::path_render(const Path& path) {
    if (path.empty()) {
        return ".";
    }
    std::string output;
    for (const auto& key : path) {
        if (std::holds_alternative<std::size_t>(key)) {
            output += fmt::format("[{}]", std::get<std::size_t>(key));
        } else {
            if (!output.empty()) {
                output += '.';
            }
            output += std::get<std::string>(key);
        }
    }
    return output;
}
