#include "value_tokenizer.hpp"

#include <fmt/format.h>

#include <charconv>
#include <string_view>
#include <tuple>

using namespace patchwork;
using namespace patchwork::value_tokenizer;

namespace {

// clang-format off
const std::vector<std::tuple<TokenId, std::string>> kTokenNames = {
    {TokenId_OpenBracket,  "OpenBracket"},
    {TokenId_CloseBracket, "CloseBracket"},
    {TokenId_OpenCurly,    "OpenCurly"},
    {TokenId_CloseCurly,   "CloseCurly"},
    {TokenId_Assign,       "Assign"},
    {TokenId_Comma,        "Comma"},
    {TokenId_Dot,          "Dot"},
    {TokenId_Boolean,      "Boolean"},
    {TokenId_Integer,      "Integer"},
    {TokenId_Float,        "Float"},
    {TokenId_String,       "String"},
    {TokenId_Identifier,   "Identifier"},
    {TokenId_Terminator,   "Terminator"},
};
// clang-format on

bool
is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool
is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9') || c == '-';
}

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool
is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

bool
patchwork::value_tokenizer::tokenize(const std::string& input_text,
                                     ParseResult& result,
                                     std::vector<Token>& tokens) {
    result = ParseResult{};
    tokens.clear();

    const std::string_view text{input_text};
    const std::size_t size = text.size();
    std::size_t cursor = 0;
    int64_t line = 1;
    std::size_t line_start = 0;

    auto column_of = [&line_start](std::size_t offset) { return static_cast<int64_t>(offset - line_start) + 1; };

    auto fail = [&](std::size_t offset, const std::string& message) {
        const auto column = column_of(offset);
        result.set_error(ParseErrorKind::Tokenization,
                         fmt::format("{} at line {} column {}", message, line, column), line,
                         source_line(input_text, line));
        return false;
    };

    auto push = [&](TokenId id, std::size_t offset) -> Token& {
        Token token;
        token.id = id;
        token.line = line;
        token.column = column_of(offset);
        tokens.push_back(std::move(token));
        return tokens.back();
    };

    while (cursor < size) {
        const char c = text[cursor];

        if (c == '\n') {
            cursor++;
            line++;
            line_start = cursor;
            continue;
        }
        if (is_blank(c)) {
            cursor++;
            continue;
        }

        // Comments run to the end of the line
        if (c == '#' || text.substr(cursor, 2) == "//") {
            while (cursor < size && text[cursor] != '\n') {
                cursor++;
            }
            continue;
        }

        switch (c) {
            case '[':
                push(TokenId_OpenBracket, cursor++);
                continue;
            case ']':
                push(TokenId_CloseBracket, cursor++);
                continue;
            case '{':
                push(TokenId_OpenCurly, cursor++);
                continue;
            case '}':
                push(TokenId_CloseCurly, cursor++);
                continue;
            case '=':
                push(TokenId_Assign, cursor++);
                continue;
            case ',':
                push(TokenId_Comma, cursor++);
                continue;
            case '.':
                push(TokenId_Dot, cursor++);
                continue;
            default:
                break;
        }

        if (c == '"' || c == '\'') {
            const std::size_t start = cursor;
            const char quote = c;
            std::string contents;
            cursor++;
            bool terminated = false;
            while (cursor < size) {
                const char s = text[cursor];
                if (s == quote) {
                    terminated = true;
                    cursor++;
                    break;
                }
                if (s == '\n') {
                    break;
                }
                if (s == '\\') {
                    if (cursor + 1 >= size) {
                        break;
                    }
                    const char escaped = text[cursor + 1];
                    switch (escaped) {
                        case '\\':
                            contents += '\\';
                            break;
                        case '\'':
                            contents += '\'';
                            break;
                        case '"':
                            contents += '"';
                            break;
                        case 'n':
                            contents += '\n';
                            break;
                        case 't':
                            contents += '\t';
                            break;
                        default:
                            return fail(cursor, fmt::format("Unknown escape sequence '\\{}'", escaped));
                    }
                    cursor += 2;
                    continue;
                }
                contents += s;
                cursor++;
            }
            if (!terminated) {
                return fail(start, "Unterminated string");
            }
            push(TokenId_String, start).text = std::move(contents);
            continue;
        }

        if (is_digit(c) || ((c == '-' || c == '+') && cursor + 1 < size && is_digit(text[cursor + 1]))) {
            const std::size_t start = cursor;
            bool is_float = false;
            cursor++;
            while (cursor < size) {
                const char n = text[cursor];
                if (is_digit(n)) {
                    cursor++;
                } else if (n == '.' && cursor + 1 < size && is_digit(text[cursor + 1])) {
                    is_float = true;
                    cursor++;
                } else if ((n == 'e' || n == 'E')) {
                    is_float = true;
                    cursor++;
                    if (cursor < size && (text[cursor] == '-' || text[cursor] == '+')) {
                        cursor++;
                    }
                } else {
                    break;
                }
            }
            if (cursor < size && is_identifier_char(text[cursor])) {
                return fail(start, "Malformed number");
            }

            // from_chars does not accept a leading '+'
            std::size_t number_start = start;
            if (text[number_start] == '+') {
                number_start++;
            }
            const char* first = text.data() + number_start;
            const char* last = text.data() + cursor;

            if (is_float) {
                double value = 0.0;
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec != std::errc() || ptr != last) {
                    return fail(start, "Malformed number");
                }
                push(TokenId_Float, start).token_float_arg = value;
            } else {
                int64_t value = 0;
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec != std::errc() || ptr != last) {
                    return fail(start, "Integer out of range");
                }
                push(TokenId_Integer, start).token_int_arg = value;
            }
            continue;
        }

        if (is_identifier_start(c)) {
            const std::size_t start = cursor;
            while (cursor < size && is_identifier_char(text[cursor])) {
                cursor++;
            }
            std::string word{text.substr(start, cursor - start)};
            if (word == "true" || word == "on") {
                push(TokenId_Boolean, start).token_boolean_arg = true;
            } else if (word == "false" || word == "off") {
                push(TokenId_Boolean, start).token_boolean_arg = false;
            } else {
                push(TokenId_Identifier, start).text = std::move(word);
            }
            continue;
        }

        return fail(cursor, fmt::format("Unexpected character '{}'", c));
    }

    push(TokenId_Terminator, cursor);
    return true;
}

std::string
patchwork::value_tokenizer::source_line(const std::string& text, int64_t line_number) {
    std::string::size_type start = 0;
    for (int64_t line = 1; line < line_number; line++) {
        start = text.find('\n', start);
        if (start == std::string::npos) {
            return "";
        }
        start++;
    }
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
        end = text.size();
    }
    return text.substr(start, end - start);
}

std::string
patchwork::value_tokenizer::repr(TokenId id) {
    std::string s;
    for (const auto& [token_id, name] : kTokenNames) {
        if (id & token_id) {
            s += "TokenId_" + name;
            s += "|";
        }
    }
    if (s.empty()) {
        return "TokenId_None";
    }
    return s.substr(0, s.size() - 1);  // drop trailing pipe
}
