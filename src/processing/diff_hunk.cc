#include "diff_hunk.hpp"

#include <algorithm>

using namespace patchwork;

namespace {

// Return all ranges of consecutive deletions and insertions.
std::vector<HunkRange>
find_change_ranges(const std::vector<EditType>& edit_types) {
    std::vector<HunkRange> ranges;
    bool in_change = false;
    for (size_t i = 0; i < edit_types.size(); i++) {
        const bool is_change = edit_types[i] != EditType::Equal;
        if (is_change && !in_change) {
            ranges.push_back({static_cast<int64_t>(i), static_cast<int64_t>(i)});
        } else if (is_change) {
            ranges.back().end = static_cast<int64_t>(i);
        }
        in_change = is_change;
    }
    return ranges;
}

// Combine change ranges separated by at most `2 * context_size` equal
// edits; there are context lines at the end of one range and at the start
// of the next one. Then extend every range by its context lines.
std::vector<HunkRange>
extend_change_ranges(const std::vector<HunkRange>& change_ranges,
                     const int64_t edit_count,
                     const int64_t context_size) {
    std::vector<HunkRange> merged;
    for (const auto& range : change_ranges) {
        if (!merged.empty()) {
            const int64_t gap = range.start - merged.back().end - 1;
            if (gap <= context_size * 2) {
                merged.back().end = range.end;
                continue;
            }
        }
        merged.push_back(range);
    }

    // Don't extend past valid boundaries
    for (auto& range : merged) {
        range.start = std::max<int64_t>(0, range.start - context_size);
        range.end = std::min<int64_t>(edit_count - 1, range.end + context_size);
    }

    return merged;
}

}  // namespace

std::vector<HunkRange>
patchwork::compose_hunk_ranges(const std::vector<EditType>& edit_types, int64_t context_size) {
    // Any context wider than the script is the whole script.
    const auto edit_count = static_cast<int64_t>(edit_types.size());
    context_size = std::clamp<int64_t>(context_size, 0, edit_count);

    // Start by finding all changes without taking context size into consideration.
    const auto change_ranges = find_change_ranges(edit_types);

    // And then extend the ranges to include context lines. Join adjacent ranges.
    return extend_change_ranges(change_ranges, edit_count, context_size);
}

std::string
patchwork::repr(LineKind kind) {
    switch (kind) {
        case LineKind::Context:
            return "Context";
        case LineKind::Delete:
            return "Delete";
        case LineKind::Insert:
            return "Insert";
    }
    return "Unknown";
}
