#include "algorithm.hpp"

#include "myers_greedy.hpp"
#include "util/readlines.hpp"

std::string
patchwork::repr(EditType type) {
    switch (type) {
        case EditType::Delete:
            return "Delete";
        case EditType::Insert:
            return "Insert";
        case EditType::Equal:
            return "Equal";
    }
    return "Unknown";
}

patchwork::EditScript<std::string>
patchwork::diff_lines(const std::string& old_text, const std::string& new_text) {
    const auto old_lines = split_lines(old_text);
    const auto new_lines = split_lines(new_text);
    return diff(old_lines, new_lines);
}
