#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace patchwork {

// clang-format off
enum class ParseErrorKind {
    None          = 1 << 0,
    File          = 1 << 1, // File related, could be made more granular
    Header        = 1 << 2, // Unexpected text before the first hunk
    Range         = 1 << 3, // Malformed "@@ -a,b +c,d @@" line
    LinePrefix    = 1 << 4, // Hunk line without ' ', '-' or '+'
    CountMismatch = 1 << 5, // Hunk body does not match the declared counts
    Tokenization  = 1 << 6,
    Parsing       = 1 << 7,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    // Offending input line, 1-based; 0 when not tied to a line.
    int64_t line_number = 0;
    std::string line;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(ParseErrorKind error_kind, std::string message, int64_t at_line = 0, std::string line_text = {}) {
        kind = error_kind;
        error = std::move(message);
        line_number = at_line;
        line = std::move(line_text);
    }
};

std::string
repr(ParseErrorKind kind);

}  // namespace patchwork
