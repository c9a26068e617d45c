#include "output/unified.hpp"

#include "algorithms/myers_greedy.hpp"
#include "processing/diff_hunk.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchwork;

using Strings = std::vector<std::string>;

TEST_CASE("unified_diff_render") {
    SUBCASE("with_labels") {
        auto hunks = compose_hunks(diff(Strings{"hello", "world"}, Strings{"hello", "there"}));
        REQUIRE(unified_diff_render(hunks, "greeting.txt", "greeting.txt") ==
                "--- greeting.txt\n+++ greeting.txt\n@@ -1,2 +1,2 @@\n hello\n-world\n+there\n");
    }

    SUBCASE("without_labels") {
        auto hunks = compose_hunks(diff(Strings{"hello", "world"}, Strings{"hello", "there"}));
        REQUIRE(unified_diff_render(hunks) == "@@ -1,2 +1,2 @@\n hello\n-world\n+there\n");
    }

    SUBCASE("default_labels") {
        auto hunks = compose_hunks(diff(Strings{"x"}, Strings{"y"}));
        REQUIRE(unified_diff_render(hunks, std::nullopt, "new") == "--- a\n+++ new\n@@ -1 +1 @@\n-x\n+y\n");
        REQUIRE(unified_diff_render(hunks, "old", std::nullopt) == "--- old\n+++ b\n@@ -1 +1 @@\n-x\n+y\n");
    }

    SUBCASE("single_line_counts_are_omitted") {
        auto hunks = compose_hunks(diff(Strings{"a", "b"}, Strings{"a", "x", "b"}), 0);
        REQUIRE(unified_diff_render(hunks) == "@@ -1,0 +2 @@\n+x\n");
    }

    SUBCASE("empty_file") {
        auto hunks = compose_hunks(diff(Strings{}, Strings{"a", "b"}));
        REQUIRE(unified_diff_render(hunks) == "@@ -0,0 +1,2 @@\n+a\n+b\n");
    }

    SUBCASE("no_hunks") {
        REQUIRE(unified_diff_render(std::vector<Hunk<std::string>>{}, "a", "b").empty());
    }

    SUBCASE("empty_lines") {
        auto hunks = compose_hunks(diff(Strings{"", "a"}, Strings{"", "b"}));
        REQUIRE(unified_diff_render(hunks) == "@@ -1,2 +1,2 @@\n \n-a\n+b\n");
    }

    SUBCASE("range_line") {
        CHECK(unified_range_line(1, 1, 1, 1) == "@@ -1 +1 @@");
        CHECK(unified_range_line(3, 0, 4, 2) == "@@ -3,0 +4,2 @@");
    }
}
