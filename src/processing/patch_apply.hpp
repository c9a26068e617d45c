#pragma once

/*
    Apply hunks to a sequence.

    Every Context and Delete line of a hunk is checked against the input.
    The first mismatch fails the whole application and no output is
    returned. Hunks are applied in ascending
    `from_start` order. Since positions are taken from the old side only,
    hunks may be given in any order but must not overlap.
*/

#include "algorithms/algorithm.hpp"
#include "processing/conflict.hpp"
#include "processing/diff_hunk.hpp"

#include <gsl/span>

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace patchwork {

template <typename Unit>
struct ApplyResult {
    ApplyStatus status = ApplyStatus::OK;
    std::vector<Unit> output;
    ConflictError conflict;

    bool
    is_ok() const {
        return status == ApplyStatus::OK;
    }
};

ConflictError
make_hunk_conflict(int64_t hunk_index, int64_t offset, int64_t position, const std::string& message);

namespace internal {

template <typename Unit>
ApplyResult<Unit>
apply_conflict(ConflictError conflict) {
    ApplyResult<Unit> result;
    result.status = ApplyStatus::Conflict;
    result.conflict = std::move(conflict);
    return result;
}

}  // namespace internal

template <typename Unit>
ApplyResult<Unit>
patch_apply(gsl::span<const Unit> old_units, const std::vector<Hunk<Unit>>& hunks) {
    const auto old_size = static_cast<int64_t>(old_units.size());
    auto old_at = [&old_units](int64_t index) -> const Unit& {
        return old_units[static_cast<size_t>(index)];
    };

    std::vector<size_t> order(hunks.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&hunks](size_t a, size_t b) { return hunks[a].from_start < hunks[b].from_start; });

    std::vector<Unit> output;
    int64_t cursor = 0;

    for (const auto hunk_index : order) {
        const auto& hunk = hunks[hunk_index];
        const auto index = static_cast<int64_t>(hunk_index);

        // A hunk without old lines is anchored after line `from_start`.
        const int64_t position = hunk.from_count > 0 ? hunk.from_start - 1 : hunk.from_start;
        if (position < cursor) {
            return internal::apply_conflict<Unit>(
                make_hunk_conflict(index, 0, position, "hunk overlaps a previous hunk"));
        }
        if (position > old_size) {
            return internal::apply_conflict<Unit>(
                make_hunk_conflict(index, 0, position, "hunk starts past the end of the input"));
        }

        // Untouched region before the hunk
        for (; cursor < position; cursor++) {
            output.push_back(old_at(cursor));
        }

        int64_t offset = 0;
        for (const auto& line : hunk.lines) {
            switch (line.kind) {
                case LineKind::Context:
                case LineKind::Delete: {
                    if (cursor >= old_size) {
                        return internal::apply_conflict<Unit>(
                            make_hunk_conflict(index, offset, cursor, "unexpected end of input"));
                    }
                    if (!(old_at(cursor) == line.value)) {
                        return internal::apply_conflict<Unit>(
                            make_hunk_conflict(index, offset, cursor, "content does not match"));
                    }
                    if (line.kind == LineKind::Context) {
                        output.push_back(line.value);
                    }
                    cursor++;
                } break;
                case LineKind::Insert: {
                    output.push_back(line.value);
                } break;
            }
            offset++;
        }
    }

    // Untouched region after the last hunk
    for (; cursor < old_size; cursor++) {
        output.push_back(old_at(cursor));
    }

    ApplyResult<Unit> result;
    result.output = std::move(output);
    return result;
}

template <typename Unit>
ApplyResult<Unit>
patch_apply(const std::vector<Unit>& old_units, const std::vector<Hunk<Unit>>& hunks) {
    return patch_apply(gsl::span<const Unit>(old_units), hunks);
}

template <typename Unit>
ApplyResult<Unit>
patch_apply(const std::vector<Unit>& old_units, const Patch<Unit>& patch) {
    return patch_apply(gsl::span<const Unit>(old_units), patch.hunks);
}

// Replay an edit script computed against the old sequence. Equal values
// are taken from the script, so the old sequence is not needed.
template <typename Unit>
std::vector<Unit>
edit_script_replay(const EditScript<Unit>& edit_script) {
    std::vector<Unit> output;
    output.reserve(edit_script.size());
    for (const auto& e : edit_script) {
        if (e.type != EditType::Delete) {
            output.push_back(e.value);
        }
    }
    return output;
}

}  // namespace patchwork
