#include "structural/value_parser.hpp"

#include "structural/value_serializer.hpp"
#include "structural/value_tokenizer.hpp"

#include <doctest.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace patchwork;

namespace {

Value
parse_document(const std::string& text) {
    Value value;
    ParseResult result;
    if (!value_parse_document(text, result, value)) {
        printf("%s\n", result.error.c_str());
    }
    REQUIRE(result.is_ok());
    return value;
}

Value
parse_value(const std::string& text) {
    Value value;
    ParseResult result;
    if (!value_parse(text, result, value)) {
        printf("%s\n", result.error.c_str());
    }
    REQUIRE(result.is_ok());
    return value;
}

}  // namespace

TEST_CASE("value_tokenizer") {
    using namespace value_tokenizer;

    SUBCASE("empty") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE(tokenize("", result, tokens));
        REQUIRE(tokens.size() == 1);
        CHECK(tokens[0].id == TokenId_Terminator);
    }

    SUBCASE("tagged_values") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE(tokenize("key = [12, -3.5, on, 'a\\'b'] # trailing", result, tokens));
        REQUIRE(tokens.size() == 12);
        CHECK(tokens[0].id == TokenId_Identifier);
        CHECK(tokens[0].text == "key");
        CHECK(tokens[1].id == TokenId_Assign);
        CHECK(tokens[2].id == TokenId_OpenBracket);
        CHECK(tokens[3].id == TokenId_Integer);
        CHECK(tokens[3].token_int_arg == 12);
        CHECK(tokens[5].id == TokenId_Float);
        CHECK(tokens[5].token_float_arg == -3.5);
        CHECK(tokens[7].id == TokenId_Boolean);
        CHECK(tokens[7].token_boolean_arg);
        CHECK(tokens[9].id == TokenId_String);
        CHECK(tokens[9].text == "a'b");
        CHECK(tokens[10].id == TokenId_CloseBracket);
        CHECK(tokens[11].id == TokenId_Terminator);
    }

    SUBCASE("positions") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE(tokenize("// header\n  a = 1\n", result, tokens));
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0].line == 2);
        CHECK(tokens[0].column == 3);
        CHECK(tokens[2].column == 7);
    }

    SUBCASE("unterminated_string") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE_FALSE(tokenize("a = 'oops\nb = 2", result, tokens));
        CHECK(result.kind == ParseErrorKind::Tokenization);
        CHECK(result.line_number == 1);
        CHECK(result.line == "a = 'oops");
    }

    SUBCASE("bad_character") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE_FALSE(tokenize("a = 1\nb = $", result, tokens));
        CHECK(result.kind == ParseErrorKind::Tokenization);
        CHECK(result.line_number == 2);
        CHECK(result.error == "Unexpected character '$' at line 2 column 5");
    }

    SUBCASE("repr") {
        CHECK(repr(TokenId_Comma) == "TokenId_Comma");
        CHECK(repr(TokenId_Integer | TokenId_Float) == "TokenId_Integer|TokenId_Float");
    }
}

TEST_CASE("value_parser") {
    SUBCASE("document") {
        auto value = parse_document(R"foo(
            # leading comment
            name = "patchwork"     // trailing comment
            ratio = 0.5

            [general]
                context_lines = 3
                labels = ['old', "new",]
                enabled = off

            [servers.alpha]
                endpoint = { host = 'localhost', port = 8080, }
        )foo");

        REQUIRE(value.is_table());
        auto& root = value.as_table();
        CHECK(root.keys() == std::vector<std::string>{"name", "ratio", "general", "servers"});
        CHECK(root.at("name").as_string() == "patchwork");
        CHECK(root.at("ratio").as_float() == 0.5);

        const Value* context = value.lookup_value_by_path("general.context_lines");
        REQUIRE(context != nullptr);
        CHECK(context->as_int() == 3);

        const Value* labels = value.lookup_value_by_path("general.labels");
        REQUIRE(labels != nullptr);
        REQUIRE(labels->as_array().size() == 2);
        CHECK(labels->as_array()[1].as_string() == "new");

        CHECK(value.lookup_value_by_path("general.enabled")->as_bool() == false);

        const Value* port = value.lookup_value_by_path("servers.alpha.endpoint.port");
        REQUIRE(port != nullptr);
        CHECK(port->as_int() == 8080);
    }

    SUBCASE("empty_document") {
        auto value = parse_document("  # nothing here\n");
        REQUIRE(value.is_table());
        CHECK(value.as_table().empty());
    }

    SUBCASE("bare_section") {
        auto value = parse_document("[section]");
        REQUIRE(value.contains("section"));
        CHECK(value.as_table().at("section").as_table().empty());
    }

    SUBCASE("quoted_keys") {
        auto value = parse_document("'my key' = 1\n[\"a b\"]\nc = 2");
        CHECK(value.as_table().at("my key").as_int() == 1);
        CHECK(value.lookup_value_by_path("a b.c")->as_int() == 2);
    }

    SUBCASE("single_values") {
        CHECK(parse_value("42") == to_value(42));
        CHECK(parse_value("'text'") == to_value("text"));
        CHECK(parse_value("[1, [2, 3], {}]") ==
              Value{Value::Array{to_value(1), to_value(std::vector<int>{2, 3}), Value{Value::Table{}}}});
    }

    SUBCASE("naked_table_value") {
        auto value = parse_value("fg='white', bg='default', attr=['underline']");
        REQUIRE(value.is_table());
        CHECK(value.as_table().keys() == std::vector<std::string>{"fg", "bg", "attr"});
        CHECK(value.as_table().at("attr") == to_value(std::vector<std::string>{"underline"}));
    }

    SUBCASE("duplicate_key") {
        Value value;
        ParseResult result;
        REQUIRE_FALSE(value_parse_document("a = 1\na = 2\n", result, value));
        CHECK(result.kind == ParseErrorKind::Parsing);
        CHECK(result.line_number == 2);
    }

    SUBCASE("section_over_value") {
        Value value;
        ParseResult result;
        REQUIRE_FALSE(value_parse_document("a = 1\n[a]\n", result, value));
        CHECK(result.kind == ParseErrorKind::Parsing);
    }

    SUBCASE("missing_value") {
        Value value = to_value(5);
        ParseResult result;
        REQUIRE_FALSE(value_parse_document("[general]\nkey =\n", result, value));
        CHECK(result.kind == ParseErrorKind::Parsing);
        CHECK(result.line_number == 3);
        // Untouched on failure
        CHECK(value == to_value(5));
    }

    SUBCASE("missing_comma") {
        Value value;
        ParseResult result;
        REQUIRE_FALSE(value_parse("[1 2]", result, value));
        CHECK(result.kind == ParseErrorKind::Parsing);
        CHECK(result.error == "Expected ',' or ']', found TokenId_Integer at line 1 column 4");
    }

    SUBCASE("trailing_garbage") {
        Value value;
        ParseResult result;
        REQUIRE_FALSE(value_parse("1 2", result, value));
        REQUIRE_FALSE(value_parse("", result, value));
    }

    SUBCASE("missing_file") {
        Value value;
        ParseResult result;
        REQUIRE_FALSE(value_load_file("/nonexistent/patchwork/file.conf", result, value));
        CHECK(result.kind == ParseErrorKind::File);
    }
}

TEST_CASE("value_serializer") {
    SUBCASE("inline") {
        auto value = parse_value("{b = [1, 2.5, true], a = 'it\\'s', c = {}, 'x y' = []}");
        CHECK(value_serialize(value) == "{b = [1, 2.5, true], a = 'it\\'s', c = {}, 'x y' = []}");
        CHECK(value_serialize(to_value(2.0)) == "2.0");
    }

    SUBCASE("document") {
        Value root{Value::Table{}};
        root.set_value_at("general.context_lines", to_value(3));
        root.set_value_at("name", to_value("x"));
        root.set_value_at("general.nested.flag", to_value(false));
        root.set_value_at("other.list", to_value(std::vector<int>{1}));

        const std::string expected =
            "name = 'x'\n"
            "\n"
            "[general]\n"
            "context_lines = 3\n"
            "\n"
            "[general.nested]\n"
            "flag = false\n"
            "\n"
            "[other]\n"
            "list = [1]\n";
        REQUIRE(value_serialize_document(root) == expected);
    }

    SUBCASE("document_round_trip") {
        const std::string text = R"foo(
            title = "multi\nline\ttext"
            [a]
                x = -17
                y = [{k = 'v'}, [], 1e3]
            [a.b.c]
                z = on
            [d]
        )foo";
        auto value = parse_document(text);
        auto serialized = value_serialize_document(value);
        auto reparsed = parse_document(serialized);
        REQUIRE(reparsed == value);
        REQUIRE(value_serialize_document(reparsed) == serialized);
    }
}
