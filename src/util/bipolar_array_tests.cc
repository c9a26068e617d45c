#include "bipolar_array.hpp"

#include <doctest.h>

TEST_CASE("BipolarArray") {
    SUBCASE("simple") {
        auto a = patchwork::BipolarArray<unsigned int>(-1, 1);
        a[0] = 1;
        a[-1] = 1;

        REQUIRE(a[0] == 1);
        REQUIRE(a[-1] == 1);
        REQUIRE(a[1] == 0);
        REQUIRE(a.size() == 3);
    }

    SUBCASE("check_range") {
        auto a = patchwork::BipolarArray<int>(-5, 5);
        for (int i = -5; i <= 5; i++) {
            a[i] = i;
        }
        for (int i = -5; i <= 5; i++) {
            CHECK(a[i] == i);
        }
        CHECK(a.contains(-5));
        CHECK(a.contains(5));
        CHECK_FALSE(a.contains(6));
        CHECK_FALSE(a.contains(-6));
    }

    SUBCASE("slice") {
        auto a = patchwork::BipolarArray<int64_t>(-4, 4);
        for (int i = -4; i <= 4; i++) {
            a[i] = i * 10;
        }
        auto s = a.slice(-2, 2);
        REQUIRE(s.size() == 5);
        REQUIRE_FALSE(s.contains(3));
        for (int i = -2; i <= 2; i++) {
            CHECK(s[i] == i * 10);
        }

        // The slice is a copy.
        s[0] = 99;
        CHECK(a[0] == 0);
    }

    SUBCASE("zero_width_slice") {
        auto a = patchwork::BipolarArray<uint8_t>(-1, 1);
        a[0] = 7;
        auto s = a.slice(0, 0);
        REQUIRE(s.size() == 1);
        CHECK(s[0] == 7);
    }
}
