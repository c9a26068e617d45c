#include "processing/patch_apply.hpp"

#include "algorithms/myers_greedy.hpp"
#include "processing/diff_hunk.hpp"

#include <doctest.h>

#include <random>
#include <string>
#include <vector>

using namespace patchwork;

namespace {

using Strings = std::vector<std::string>;

std::vector<int>
random_sequence(std::mt19937& rng, int max_length, int alphabet) {
    std::uniform_int_distribution<int> length_dist(0, max_length);
    std::uniform_int_distribution<int> value_dist(0, alphabet - 1);
    std::vector<int> seq(static_cast<size_t>(length_dist(rng)));
    for (auto& v : seq) {
        v = value_dist(rng);
    }
    return seq;
}

}  // namespace

TEST_CASE("patch_apply") {
    SUBCASE("hello_there") {
        Strings a{"hello", "world"};
        Strings b{"hello", "there"};
        auto result = patch_apply(a, compose_hunks(diff(a, b)));
        REQUIRE(result.is_ok());
        REQUIRE(result.output == b);
    }

    SUBCASE("no_hunks_is_identity") {
        Strings a{"a", "b"};
        auto result = patch_apply(a, std::vector<Hunk<std::string>>{});
        REQUIRE(result.is_ok());
        REQUIRE(result.output == a);
    }

    SUBCASE("hunks_in_any_order") {
        Strings a{"1", "2", "3", "4", "5", "6", "7", "8", "9", "10"};
        Strings b{"99", "2", "3", "4", "5", "6", "7", "8", "9", "99"};
        auto hunks = compose_hunks(diff(a, b), 1);
        REQUIRE(hunks.size() == 2);
        std::swap(hunks[0], hunks[1]);
        auto result = patch_apply(a, hunks);
        REQUIRE(result.is_ok());
        REQUIRE(result.output == b);
    }

    SUBCASE("insert_into_empty") {
        Strings b{"a", "b"};
        auto result = patch_apply(Strings{}, compose_hunks(diff(Strings{}, b)));
        REQUIRE(result.is_ok());
        REQUIRE(result.output == b);
    }

    SUBCASE("conflict_on_mismatch") {
        Strings a{"hello", "world"};
        Strings b{"hello", "there"};
        auto hunks = compose_hunks(diff(a, b));

        auto result = patch_apply(Strings{"hello", "there"}, hunks);
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.status == ApplyStatus::Conflict);
        CHECK(result.output.empty());
        CHECK(result.conflict.hunk_index == 0);
        CHECK(result.conflict.offset == 1);
        CHECK(result.conflict.position == 1);
        CHECK(result.conflict.location == "hunk #1, line 2");
        CHECK_FALSE(result.conflict.message.empty());
    }

    SUBCASE("conflict_names_the_callers_hunk") {
        Strings a{"1", "2", "3", "4", "5", "6", "7", "8", "9", "10"};
        Strings b{"99", "2", "3", "4", "5", "6", "7", "8", "9", "99"};
        auto hunks = compose_hunks(diff(a, b), 1);
        std::swap(hunks[0], hunks[1]);

        Strings c = a;
        c[9] = "ten";
        auto result = patch_apply(c, hunks);
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.conflict.hunk_index == 0);
        CHECK(result.conflict.position == 9);
    }

    SUBCASE("conflict_on_short_input") {
        Strings a{"a", "b", "c"};
        auto hunks = compose_hunks(diff(a, Strings{"a", "b", "x"}));
        auto result = patch_apply(Strings{"a", "b"}, hunks);
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.output.empty());
    }

    SUBCASE("conflict_on_overlap") {
        Hunk<std::string> first{1, 2, 1, 1, {{LineKind::Context, "a"}, {LineKind::Delete, "b"}}};
        Hunk<std::string> second{2, 1, 1, 0, {{LineKind::Delete, "b"}}};
        auto result = patch_apply(Strings{"a", "b", "c"}, std::vector{first, second});
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.conflict.hunk_index == 1);
    }

    SUBCASE("conflict_past_end") {
        Hunk<std::string> hunk{5, 0, 5, 1, {{LineKind::Insert, "z"}}};
        auto result = patch_apply(Strings{"a"}, std::vector{hunk});
        REQUIRE_FALSE(result.is_ok());
        CHECK(result.conflict.position == 5);
    }

    SUBCASE("zero_start_with_old_lines") {
        Hunk<std::string> hunk{0, 1, 1, 1, {{LineKind::Delete, "a"}, {LineKind::Insert, "b"}}};
        auto result = patch_apply(Strings{"a"}, std::vector{hunk});
        REQUIRE_FALSE(result.is_ok());
    }

    SUBCASE("input_is_not_modified") {
        const Strings a{"hello", "world"};
        const Strings copy = a;
        auto result = patch_apply(a, compose_hunks(diff(a, Strings{"bye"})));
        REQUIRE(result.is_ok());
        CHECK(a == copy);
    }
}

TEST_CASE("edit_script_replay") {
    Strings a{"a", "b", "c"};
    Strings b{"a", "x", "c", "d"};
    REQUIRE(edit_script_replay(diff(a, b)) == b);
    REQUIRE(edit_script_replay(EditScript<std::string>{}).empty());
}

TEST_CASE("patch_apply_properties") {
    std::mt19937 rng(4321);

    for (int iteration = 0; iteration < 200; iteration++) {
        const auto a = random_sequence(rng, 30, 5);
        const auto b = random_sequence(rng, 30, 5);
        const auto script = diff(a, b);

        for (int64_t context_size = 0; context_size <= 4; context_size++) {
            const auto hunks = compose_hunks(script, context_size);

            // Line counts match the declared ranges, hunks are ordered and apart
            int64_t previous_end = -1;
            for (const auto& hunk : hunks) {
                int64_t from_count = 0, to_count = 0;
                for (const auto& line : hunk.lines) {
                    if (line.kind != LineKind::Insert)
                        from_count++;
                    if (line.kind != LineKind::Delete)
                        to_count++;
                }
                REQUIRE(from_count == hunk.from_count);
                REQUIRE(to_count == hunk.to_count);

                const int64_t start = hunk.from_count > 0 ? hunk.from_start - 1 : hunk.from_start;
                REQUIRE(start >= previous_end);
                previous_end = start + hunk.from_count;
            }

            const auto result = patch_apply(a, hunks);
            REQUIRE(result.is_ok());
            REQUIRE(result.output == b);
        }

        if (a == b) {
            REQUIRE(compose_hunks(script, 3).empty());
        }
    }
}
