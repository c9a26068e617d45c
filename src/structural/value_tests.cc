#include "structural/value.hpp"

#include <doctest.h>

#include <limits>
#include <map>
#include <string>
#include <vector>

using namespace patchwork;

TEST_CASE("value") {
    SUBCASE("shape") {
        CHECK(Value{Value::Table{}}.shape() == ValueShape::Map);
        CHECK(Value{Value::Array{}}.shape() == ValueShape::List);
        CHECK(to_value(1).shape() == ValueShape::Scalar);
        CHECK(to_value("x").shape() == ValueShape::Scalar);
        CHECK(to_value(true).shape() == ValueShape::Scalar);
        CHECK(to_value(1.5).shape() == ValueShape::Scalar);
    }

    SUBCASE("table_order_is_not_significant") {
        Value a{Value::Table{{"x", to_value(1)}, {"y", to_value(2)}}};
        Value b{Value::Table{{"y", to_value(2)}, {"x", to_value(1)}}};
        CHECK(a == b);
        CHECK(a.as_table().keys() == std::vector<std::string>{"x", "y"});
        CHECK(b.as_table().keys() == std::vector<std::string>{"y", "x"});
    }

    SUBCASE("scalar_types_differ") {
        CHECK(to_value(1) != to_value(1.0));
        CHECK(to_value(1) != to_value(true));
        CHECK(to_value("1") != to_value(1));
        CHECK(to_value(std::string("a")) == to_value("a"));
    }

    SUBCASE("nan_equals_itself") {
        const auto nan = std::numeric_limits<double>::quiet_NaN();
        CHECK(to_value(nan) == to_value(nan));
        CHECK(to_value(nan) != to_value(1.0));
        CHECK(to_value(std::vector<double>{1.0, nan}) == to_value(std::vector<double>{1.0, nan}));
    }

    SUBCASE("array_order_is_significant") {
        CHECK(to_value(std::vector<int>{1, 2}) != to_value(std::vector<int>{2, 1}));
        CHECK(to_value(std::vector<int>{1, 2}) == to_value(std::vector<int>{1, 2}));
    }

    SUBCASE("native_conversion") {
        std::map<std::string, std::vector<int>> native{{"ports", {80, 443}}, {"empty", {}}};
        auto value = to_value(native);
        REQUIRE(value.is_table());
        REQUIRE(value.contains("ports"));
        auto& ports = value.as_table().at("ports").as_array();
        REQUIRE(ports.size() == 2);
        CHECK(ports[1].as_int() == 443);
        CHECK(value.as_table().at("empty").as_array().empty());
    }

    SUBCASE("lookup_and_set") {
        Value root{Value::Table{}};
        REQUIRE(root.set_value_at("general.context_lines", to_value(5)));
        REQUIRE(root.set_value_at("general.label", to_value("x")));

        const Value* found = root.lookup_value_by_path("general.context_lines");
        REQUIRE(found != nullptr);
        CHECK(found->as_int() == 5);
        CHECK(root.lookup_value_by_path("general.missing") == nullptr);
        CHECK(root.lookup_value_by_path("general.label.deeper") == nullptr);

        // Can't descend into a scalar
        CHECK_FALSE(root.set_value_at("general.label.deeper", to_value(1)));

        // Overwriting keeps the position
        REQUIRE(root.set_value_at("general.context_lines", to_value(7)));
        auto& general = root.as_table().at("general").as_table();
        CHECK(general.keys() == std::vector<std::string>{"context_lines", "label"});
        CHECK(general.at("context_lines").as_int() == 7);
    }

    SUBCASE("repr") {
        CHECK(repr(to_value(5)) == "Integer<5>");
        CHECK(repr(to_value("hi")) == "String<'hi'>");
        CHECK(repr(to_value(true)) == "Boolean<true>");
        CHECK(repr(Value{Value::Array{}}) == "Array<0>");
    }
}
