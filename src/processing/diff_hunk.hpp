#pragma once

/*
    Compose diff hunks out of an edit script.

    A hunk is a run of changes plus up to `context_size` unchanged units on
    each side. Changes separated by fewer than 2 * context_size + 1 unchanged
    units share their context and end up in the same hunk.

    Start numbers are 1-based, as in a unified diff. When a side of the hunk
    is empty its start is the number of units preceding the hunk on that
    side, so an insertion into an empty file reads `-0,0 +1,N`.
*/

#include "algorithms/algorithm.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchwork {

enum class LineKind {
    Context,
    Delete,
    Insert,
};

template <typename Unit>
struct HunkLine {
    LineKind kind;
    Unit value;

    bool
    operator==(const HunkLine& other) const {
        return kind == other.kind && value == other.value;
    }
};

template <typename Unit>
struct Hunk {
    int64_t from_start = 0;
    int64_t from_count = 0;
    int64_t to_start = 0;
    int64_t to_count = 0;

    std::vector<HunkLine<Unit>> lines;

    bool
    operator==(const Hunk& other) const {
        return from_start == other.from_start && from_count == other.from_count &&
               to_start == other.to_start && to_count == other.to_count && lines == other.lines;
    }
};

template <typename Unit>
struct Patch {
    std::optional<std::string> from_label;
    std::optional<std::string> to_label;

    std::vector<Hunk<Unit>> hunks;

    bool
    operator==(const Patch& other) const {
        return from_label == other.from_label && to_label == other.to_label && hunks == other.hunks;
    }
};

// Inclusive range of edit script indices.
struct HunkRange {
    int64_t start;
    int64_t end;
};

// Find the ranges of the edit script that become hunks, context included.
std::vector<HunkRange>
compose_hunk_ranges(const std::vector<EditType>& edit_types, int64_t context_size);

std::string
repr(LineKind kind);

template <typename Unit>
std::vector<Hunk<Unit>>
compose_hunks(const EditScript<Unit>& edit_script, const int64_t context_size = 3) {
    std::vector<EditType> edit_types;
    edit_types.reserve(edit_script.size());
    for (const auto& e : edit_script) {
        edit_types.push_back(e.type);
    }

    const auto hunk_ranges = compose_hunk_ranges(edit_types, context_size);

    // Number of units consumed on each side before each edit.
    struct InsertionPoint {
        int64_t a_insertion_point = 0;
        int64_t b_insertion_point = 0;
    };
    std::vector<InsertionPoint> insertion_points;
    insertion_points.reserve(edit_script.size());
    {
        int64_t a_count = 0, b_count = 0;
        for (const auto& e : edit_script) {
            insertion_points.push_back({a_count, b_count});
            if (e.type != EditType::Insert)
                a_count++;
            if (e.type != EditType::Delete)
                b_count++;
        }
    }

    std::vector<Hunk<Unit>> hunks;
    hunks.reserve(hunk_ranges.size());
    for (const auto& hunk_range : hunk_ranges) {
        Hunk<Unit> hunk;
        for (auto i = hunk_range.start; i <= hunk_range.end; i++) {
            const auto& e = edit_script[static_cast<size_t>(i)];
            switch (e.type) {
                case EditType::Equal:
                    hunk.from_count++;
                    hunk.to_count++;
                    hunk.lines.push_back({LineKind::Context, e.value});
                    break;
                case EditType::Delete:
                    hunk.from_count++;
                    hunk.lines.push_back({LineKind::Delete, e.value});
                    break;
                case EditType::Insert:
                    hunk.to_count++;
                    hunk.lines.push_back({LineKind::Insert, e.value});
                    break;
            }
        }

        const auto& first = insertion_points[static_cast<size_t>(hunk_range.start)];
        hunk.from_start = hunk.from_count > 0 ? first.a_insertion_point + 1 : first.a_insertion_point;
        hunk.to_start = hunk.to_count > 0 ? first.b_insertion_point + 1 : first.b_insertion_point;

        hunks.push_back(std::move(hunk));
    }

    return hunks;
}

}  // namespace patchwork
