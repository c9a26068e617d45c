#include "value_parser.hpp"

#include "structural/value_tokenizer.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchwork;
using namespace patchwork::value_tokenizer;

namespace {

// Recursive descent over the token stream. Every parse function returns
// false after recording the error in `result_`.
struct ValueParser {
    const std::string& input_data_;
    const std::vector<Token>& tokens_;
    ParseResult& result_;
    std::size_t cursor_ = 0;

    // Nesting limit for arrays and inline tables.
    static constexpr int kMaxDepth = 256;

    ValueParser(const std::string& input_data, const std::vector<Token>& tokens, ParseResult& result)
        : input_data_(input_data), tokens_(tokens), result_(result) {
    }

    const Token&
    token() const {
        return tokens_[cursor_];
    }

    const Token&
    peek(std::size_t ahead) const {
        const auto index = std::min(cursor_ + ahead, tokens_.size() - 1);
        return tokens_[index];
    }

    void
    advance() {
        TRACE("* Consume {} '{}'\n", repr(token().id), token().text);
        if (!(token().id & TokenId_Terminator)) {
            cursor_++;
        }
    }

    bool
    is(TokenId ids) const {
        return (token().id & ids) != 0;
    }

    bool
    error(const std::string& message) {
        const auto& t = token();
        result_.set_error(ParseErrorKind::Parsing,
                          fmt::format("{} at line {} column {}", message, t.line, t.column), t.line,
                          source_line(input_data_, t.line));
        return false;
    }

    bool
    expect(TokenId expected_id) {
        if (!is(expected_id)) {
            return error(fmt::format("Expected {}, found {}", repr(expected_id), repr(token().id)));
        }
        advance();
        return true;
    }

    bool
    parse_key(std::string& key) {
        if (!is(TokenId_Key)) {
            return error(fmt::format("Expected a key, found {}", repr(token().id)));
        }
        key = token().text;
        advance();
        return true;
    }

    // `key = value`, stored in `table`
    bool
    parse_entry(Value::Table& table, int depth) {
        std::string key;
        if (!parse_key(key)) {
            return false;
        }
        if (table.contains(key)) {
            return error(fmt::format("Duplicate key '{}'", key));
        }
        if (!expect(TokenId_Assign)) {
            return false;
        }
        Value value;
        if (!parse_object(value, depth)) {
            return false;
        }
        table.insert(key, std::move(value));
        return true;
    }

    bool
    parse_object(Value& value, int depth) {
        if (depth > kMaxDepth) {
            return error("Values nested too deep");
        }
        if (is(TokenId_OpenBracket)) {
            return parse_array(value, depth + 1);
        }
        if (is(TokenId_OpenCurly)) {
            return parse_table(value, depth + 1);
        }
        if (is(TokenId_MetaValue)) {
            const auto& t = token();
            if (t.id & TokenId_Boolean) {
                value = Value{Value::Bool{t.token_boolean_arg}};
            } else if (t.id & TokenId_Integer) {
                value = Value{Value::Int{t.token_int_arg}};
            } else if (t.id & TokenId_Float) {
                value = Value{Value::Float{t.token_float_arg}};
            } else {
                value = Value{Value::String{t.text}};
            }
            advance();
            return true;
        }
        return error(fmt::format("Expected a value, found {}", repr(token().id)));
    }

    bool
    parse_array(Value& value, int depth) {
        if (!expect(TokenId_OpenBracket)) {
            return false;
        }
        Value::Array array;
        while (!is(TokenId_CloseBracket)) {
            Value element;
            if (!parse_object(element, depth)) {
                return false;
            }
            array.push_back(std::move(element));
            if (is(TokenId_Comma)) {
                advance();
            } else if (!is(TokenId_CloseBracket)) {
                return error(fmt::format("Expected ',' or ']', found {}", repr(token().id)));
            }
        }
        advance();
        value = Value{std::move(array)};
        return true;
    }

    bool
    parse_table(Value& value, int depth) {
        if (!expect(TokenId_OpenCurly)) {
            return false;
        }
        Value::Table table;
        while (!is(TokenId_CloseCurly)) {
            if (!parse_entry(table, depth)) {
                return false;
            }
            if (is(TokenId_Comma)) {
                advance();
            } else if (!is(TokenId_CloseCurly)) {
                return error(fmt::format("Expected ',' or '}}', found {}", repr(token().id)));
            }
        }
        advance();
        value = Value{std::move(table)};
        return true;
    }

    // `[a.b.c]`; returns the table the following entries go into.
    bool
    parse_section(Value& root, Value*& section) {
        if (!expect(TokenId_OpenBracket)) {
            return false;
        }
        Value* iter = &root;
        while (true) {
            std::string key;
            if (!parse_key(key)) {
                return false;
            }
            auto& table = iter->as_table();
            if (!table.contains(key)) {
                table.insert(key, Value{Value::Table{}});
            }
            iter = &table[key];
            if (!iter->is_table()) {
                return error(fmt::format("Section '{}' is already defined as a value", key));
            }
            if (is(TokenId_Dot)) {
                advance();
                continue;
            }
            break;
        }
        if (!expect(TokenId_CloseBracket)) {
            return false;
        }
        section = iter;
        return true;
    }

    bool
    parse_document(Value& root) {
        root = Value{Value::Table{}};
        Value* section = &root;
        while (!is(TokenId_Terminator)) {
            if (is(TokenId_OpenBracket)) {
                if (!parse_section(root, section)) {
                    return false;
                }
                continue;
            }
            if (!parse_entry(section->as_table(), 0)) {
                return false;
            }
        }
        return true;
    }

    bool
    parse_single_value(Value& value) {
        // Bare table; `key = value, ...` without the curly braces
        if (is(TokenId_Key) && (peek(1).id & TokenId_Assign)) {
            Value::Table table;
            while (!is(TokenId_Terminator)) {
                if (!parse_entry(table, 1)) {
                    return false;
                }
                if (is(TokenId_Comma)) {
                    advance();
                } else if (!is(TokenId_Terminator)) {
                    return error(fmt::format("Expected ',', found {}", repr(token().id)));
                }
            }
            value = Value{std::move(table)};
            return true;
        }

        if (!parse_object(value, 0)) {
            return false;
        }
        if (!is(TokenId_Terminator)) {
            return error(fmt::format("Unexpected {} after value", repr(token().id)));
        }
        return true;
    }
};

}  // namespace

bool
patchwork::value_parse_document(const std::string& input_data, ParseResult& result, Value& result_obj) {
    std::vector<Token> tokens;
    if (!tokenize(input_data, result, tokens)) {
        return false;
    }

    Value root;
    ValueParser parser{input_data, tokens, result};
    if (!parser.parse_document(root)) {
        return false;
    }
    result_obj = std::move(root);
    return true;
}

bool
patchwork::value_parse(const std::string& input_data, ParseResult& result, Value& result_obj) {
    std::vector<Token> tokens;
    if (!tokenize(input_data, result, tokens)) {
        return false;
    }

    if (tokens.size() == 1) {
        result.set_error(ParseErrorKind::Parsing, "Expected a value, found end of input");
        return false;
    }

    Value value;
    ValueParser parser{input_data, tokens, result};
    if (!parser.parse_single_value(value)) {
        return false;
    }
    result_obj = std::move(value);
    return true;
}

bool
patchwork::value_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::string contents;
    if (!read_file(file_path, contents)) {
        result.set_error(ParseErrorKind::File, fmt::format("Failed to open '{}' for reading", file_path));
        return false;
    }
    return value_parse_document(contents, result, result_obj);
}
