#pragma once

#include <cinttypes>
#include <climits>
#include <cstddef>
#include <gsl/span>
#include <string>
#include <vector>

namespace patchwork {

using std::int64_t;
using std::size_t;

struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Equal,
};

struct EditIndex {
    bool valid;
    int64_t value;
    EditIndex() : valid(false), value(0) {
    }

    EditIndex(int64_t in_value) : valid(true), value(in_value) {
    }

    operator int64_t() const {
        return value;
    }

    bool
    operator==(const EditIndex& other) const {
        return valid == other.valid && (!valid || value == other.value);
    }
};

const EditIndex EditIndexInvalid{};

// An EditOp is one step of an edit script turning A into B.
//
//   Equal:  old_index and new_index valid, value is A[old_index]
//   Delete: old_index valid, value is A[old_index]
//   Insert: new_index valid, value is B[new_index]
template <typename Unit>
struct EditOp {
    EditType type;

    EditIndex old_index;
    EditIndex new_index;

    Unit value;

    static EditOp
    Equal(int64_t old_index, int64_t new_index, const Unit& value) {
        return {EditType::Equal, EditIndex(old_index), EditIndex(new_index), value};
    }

    static EditOp
    Delete(int64_t old_index, const Unit& value) {
        return {EditType::Delete, EditIndex(old_index), EditIndexInvalid, value};
    }

    static EditOp
    Insert(int64_t new_index, const Unit& value) {
        return {EditType::Insert, EditIndexInvalid, EditIndex(new_index), value};
    }

    bool
    operator==(const EditOp& other) const {
        return type == other.type && old_index == other.old_index && new_index == other.new_index &&
               value == other.value;
    }
};

template <typename Unit>
using EditScript = std::vector<EditOp<Unit>>;

enum class DiffResultStatus {
    OK,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    std::string A_name;
    std::string B_name;
};

template <typename Unit>
struct DiffResult {
    DiffResultStatus status = DiffResultStatus::NoChanges;
    EditScript<Unit> edit_script;
};

struct EditScriptStats {
    int64_t equal = 0;
    int64_t deleted = 0;
    int64_t inserted = 0;
};

template <typename Unit>
EditScriptStats
edit_script_stats(const EditScript<Unit>& script) {
    EditScriptStats stats;
    for (const auto& op : script) {
        switch (op.type) {
            case EditType::Equal:
                stats.equal++;
                break;
            case EditType::Delete:
                stats.deleted++;
                break;
            case EditType::Insert:
                stats.inserted++;
                break;
        }
    }
    return stats;
}

std::string
repr(EditType type);

template <typename Unit>
class Algorithm {
   public:
    DiffInput<Unit>& diff_input_;

    Algorithm(DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    // Only called with two non-empty inputs.
    virtual DiffResult<Unit>
    diff() = 0;

    DiffResult<Unit>
    compute() {
        DiffResult<Unit> result;

        auto N = diff_input_.A.size();
        auto M = diff_input_.B.size();

        if (N == 0 && M > 0) {
            // M insertions
            for (decltype(N) i = 0; i < M; i++) {
                result.edit_script.push_back(
                    EditOp<Unit>::Insert(static_cast<int64_t>(i), diff_input_.B[i]));
            }
            result.status = DiffResultStatus::OK;
            return result;
        } else if (M == 0 && N > 0) {
            // N deletions
            for (decltype(N) i = 0; i < N; i++) {
                result.edit_script.push_back(
                    EditOp<Unit>::Delete(static_cast<int64_t>(i), diff_input_.A[i]));
            }
            result.status = DiffResultStatus::OK;
            return result;
        } else if (N == 0 && M == 0) {
            result.status = DiffResultStatus::NoChanges;  // Both empty; no diff.
            return result;
        }

        return diff();
    }
};

}  // namespace patchwork
