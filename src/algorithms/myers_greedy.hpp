#pragma once

// Greedy version of Myers difference algorithm; O((M+N) D).

#include "algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <gsl/span>

#include <algorithm>
#include <cassert>
#include <iterator>
#include <limits>

namespace patchwork {

template <typename Unit>
struct MyersGreedy : public Algorithm<Unit> {
   public:
    int64_t N;
    int64_t M;

    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    MyersGreedy(DiffInput<Unit>& diff_input)
        : Algorithm<Unit>(diff_input)
        , N(static_cast<int64_t>(diff_input.A.size()))
        , M(static_cast<int64_t>(diff_input.B.size()))
        , A(diff_input.A)
        , B(diff_input.B) {
    }

    virtual ~MyersGreedy() {
    }

    const Unit&
    a_at(int64_t index) const {
        return A[static_cast<std::size_t>(index)];
    }

    const Unit&
    b_at(int64_t index) const {
        return B[static_cast<std::size_t>(index)];
    }

    // Store the frontier (slice -d..d) of each D iteration for backtracking
    // the solution. Returns the edit distance.
    template <typename IndexSizeType>
    int64_t
    do_edit_distance(std::vector<BipolarArray<IndexSizeType>>& trace) {
        const int64_t max = N + M;

        // One extra slot on each side; d == 0 reads v[1].
        BipolarArray<IndexSizeType> v{-max - 1, max + 1};

        v[1] = 0;
        for (int64_t d = 0; d <= max; d++) {
            for (int64_t k = -d; k <= d; k += 2) {
                int64_t x = 0, y = 0;
                // Move down (insert), or right (delete). Equal reach prefers
                // the right move so deletions come before insertions.
                if (k == -d || (k != d && v[k - 1] < v[k + 1])) {
                    x = static_cast<int64_t>(v[k + 1]);
                } else {
                    x = static_cast<int64_t>(v[k - 1]) + 1;
                }
                y = x - k;

                // Move diagonally
                while (x < N && y < M && a_at(x) == b_at(y)) {
                    ++x;
                    ++y;
                }

                v[k] = static_cast<IndexSizeType>(x);

                if (x >= N && y >= M) {
                    trace.push_back(v.slice(-d, d));
                    return d;
                }
            }  // for k
            trace.push_back(v.slice(-d, d));
        }  // for d

        // Every input pair has a path of length N + M.
        assert(false && "Failed to figure out edit distance");
        return max;
    }

    template <typename IndexSizeType>
    void
    do_solve(const std::vector<BipolarArray<IndexSizeType>>& trace, std::vector<Move>& solution) {
        // Backtrack from (N, M) through the frontiers we've gathered. The
        // decision made at level d is recovered from the frontier of d - 1.
        int64_t x = N;
        int64_t y = M;
        for (int64_t d = static_cast<int64_t>(trace.size()) - 1; d > 0; d--) {
            const BipolarArray<IndexSizeType>& v = trace[static_cast<size_t>(d - 1)];

            const int64_t k = x - y;
            const bool down = k == -d || (k != d && v[k - 1] < v[k + 1]);
            const int64_t prev_k = down ? k + 1 : k - 1;
            const int64_t prev_x = static_cast<int64_t>(v[prev_k]);
            const int64_t prev_y = prev_x - prev_k;

            // Where the snake of this level starts.
            const int64_t snake_x = down ? prev_x : prev_x + 1;
            const int64_t snake_y = down ? prev_y + 1 : prev_y;

            while (x > snake_x && y > snake_y) {
                solution.push_back({{x - 1, y - 1}, {x, y}});
                x--;
                y--;
            }

            solution.push_back({{prev_x, prev_y}, {x, y}});

            x = prev_x;
            y = prev_y;
        }

        // The D = 0 snake starts at the origin.
        assert(x == y);
        while (x > 0 && y > 0) {
            solution.push_back({{x - 1, y - 1}, {x, y}});
            x--;
            y--;
        }
    }

    void
    do_diff(EditScript<Unit>& edit_script, const std::vector<Move>& solution) {
        // We're traversing the solution backwards.
        edit_script.reserve(solution.size());
        std::transform(solution.crbegin(), solution.crend(), std::back_inserter(edit_script),
                       [this](const Move& move) -> EditOp<Unit> {
                           auto& from = move.from;
                           auto& to = move.to;

                           if (from.x == to.x) {
                               return EditOp<Unit>::Insert(from.y, b_at(from.y));
                           } else if (to.y == from.y) {
                               return EditOp<Unit>::Delete(from.x, a_at(from.x));
                           } else {
                               return EditOp<Unit>::Equal(from.x, from.y, a_at(from.x));
                           }
                       });
    }

    template <typename IndexSizeType>
    DiffResult<Unit>
    diff_impl() {
        DiffResult<Unit> result;

        std::vector<BipolarArray<IndexSizeType>> trace;
        const int64_t edit_distance = do_edit_distance(trace);

        std::vector<Move> solution;
        do_solve(trace, solution);
        do_diff(result.edit_script, solution);

        result.status = edit_distance == 0 ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
        return result;
    }

    DiffResult<Unit>
    diff() override {
        // Run diff implementation with smaller data type for faster copies of
        // the frontier. The frontier holds x positions, at most N + 1.
        constexpr auto u8_max = std::numeric_limits<uint8_t>::max();
        constexpr auto u16_max = std::numeric_limits<uint16_t>::max();
        constexpr auto u32_max = std::numeric_limits<uint32_t>::max();
        if (N < u8_max && M < u8_max) {
            return diff_impl<uint8_t>();
        } else if (N < u16_max && M < u16_max) {
            return diff_impl<uint16_t>();
        } else if (N < u32_max && M < u32_max) {
            return diff_impl<uint32_t>();
        }
        return diff_impl<int64_t>();
    }
};

// Minimal edit script turning `old_units` into `new_units`.
template <typename Unit>
EditScript<Unit>
diff(gsl::span<const Unit> old_units, gsl::span<const Unit> new_units) {
    DiffInput<Unit> diff_input{old_units, new_units, "", ""};
    return MyersGreedy<Unit>(diff_input).compute().edit_script;
}

template <typename Unit>
EditScript<Unit>
diff(const std::vector<Unit>& old_units, const std::vector<Unit>& new_units) {
    return diff(gsl::span<const Unit>(old_units), gsl::span<const Unit>(new_units));
}

// Split both texts into lines and diff them.
EditScript<std::string>
diff_lines(const std::string& old_text, const std::string& new_text);

}  // namespace patchwork
