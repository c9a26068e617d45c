#pragma once

/*
    Unified diff rendering.

        --- old label
        +++ new label
        @@ -1,2 +1,2 @@
         hello
        -world
        +there

    The header pair is only written when at least one label is given.
    Counts of 1 are omitted from the range line, as GNU diff does.
*/

#include "processing/diff_hunk.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <vector>

namespace patchwork {

// "@@ -1,2 +1,2 @@"
std::string
unified_range_line(int64_t from_start, int64_t from_count, int64_t to_start, int64_t to_count);

// "--- a\n+++ b\n", or nothing when neither label is set
std::string
unified_header(const std::optional<std::string>& from_label, const std::optional<std::string>& to_label);

char
unified_line_prefix(LineKind kind);

template <typename Unit>
std::string
unified_diff_render(const std::vector<Hunk<Unit>>& hunks,
                    const std::optional<std::string>& from_label = std::nullopt,
                    const std::optional<std::string>& to_label = std::nullopt) {
    if (hunks.empty()) {
        return "";
    }

    std::string udiff = unified_header(from_label, to_label);
    for (const auto& hunk : hunks) {
        udiff += unified_range_line(hunk.from_start, hunk.from_count, hunk.to_start, hunk.to_count);
        udiff += '\n';
        for (const auto& line : hunk.lines) {
            udiff += fmt::format("{}{}\n", unified_line_prefix(line.kind), line.value);
        }
    }
    return udiff;
}

template <typename Unit>
std::string
unified_diff_render(const Patch<Unit>& patch) {
    return unified_diff_render(patch.hunks, patch.from_label, patch.to_label);
}

}  // namespace patchwork
