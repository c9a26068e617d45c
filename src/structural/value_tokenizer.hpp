#pragma once

/*
    Tokenizer for value documents. Tags the in-between token data as
    strings, integers, floats, booleans and identifiers so the parser only
    has to look at token ids.

    Whitespace, newlines and comments (`# ...`, `// ...`) are dropped. The
    token stream always ends with a Terminator token.
*/

#include "util/parse_result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace patchwork {
namespace value_tokenizer {

using TokenId = std::uint32_t;
// clang-format off
const TokenId TokenId_OpenBracket  = 1 << 0;
const TokenId TokenId_CloseBracket = 1 << 1;
const TokenId TokenId_OpenCurly    = 1 << 2;
const TokenId TokenId_CloseCurly   = 1 << 3;
const TokenId TokenId_Assign       = 1 << 4;
const TokenId TokenId_Comma        = 1 << 5;
const TokenId TokenId_Dot          = 1 << 6;
const TokenId TokenId_Boolean      = 1 << 7;
const TokenId TokenId_Integer      = 1 << 8;
const TokenId TokenId_Float        = 1 << 9;
const TokenId TokenId_String       = 1 << 10;
const TokenId TokenId_Identifier   = 1 << 11;
const TokenId TokenId_Terminator   = 1 << 12;

const TokenId TokenId_Key = TokenId_Identifier | TokenId_String;
const TokenId TokenId_MetaValue = TokenId_Boolean | TokenId_Integer | TokenId_Float | TokenId_String;
const TokenId TokenId_MetaObject = TokenId_OpenCurly | TokenId_OpenBracket | TokenId_MetaValue;
// clang-format on

struct Token {
    TokenId id = 0;

    // 1-based position of the first character
    int64_t line = 0;
    int64_t column = 0;

    // Identifier name, or string contents with escapes resolved
    std::string text;

    bool token_boolean_arg = false;
    int64_t token_int_arg = 0;
    double token_float_arg = 0.0;
};

bool
tokenize(const std::string& text, ParseResult& result, std::vector<Token>& tokens);

// Source line `line_number` (1-based) without its newline.
std::string
source_line(const std::string& text, int64_t line_number);

std::string
repr(TokenId id);

}  // namespace value_tokenizer
}  // namespace patchwork
