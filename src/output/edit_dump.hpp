#pragma once

#include "algorithms/algorithm.hpp"

#include <fmt/format.h>

#include <string>

namespace patchwork {

// One line per edit: "<op> <old index> <new index> <text>". Indices are
// 0-based, '-' marks the side an edit doesn't touch.
//
//         0     0  hello
//   -     1     -  world
//   +     -     1  there
template <typename Unit>
std::string
edit_dump_render(const EditScript<Unit>& script) {
    std::string dump;
    for (const auto& e : script) {
        char op = ' ';
        if (e.type == EditType::Insert)
            op = '+';
        else if (e.type == EditType::Delete)
            op = '-';

        const auto old_index = e.old_index.valid ? fmt::format("{}", e.old_index.value) : "-";
        const auto new_index = e.new_index.valid ? fmt::format("{}", e.new_index.value) : "-";
        dump += fmt::format("{} {:>5} {:>5}  {}\n", op, old_index, new_index, e.value);
    }
    return dump;
}

}  // namespace patchwork
