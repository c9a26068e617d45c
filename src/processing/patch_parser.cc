#include "patch_parser.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <string_view>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchwork;

namespace internal {

bool
starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Consume a non-negative number from the front of `s`.
std::optional<int64_t>
consume_number(std::string_view& s) {
    if (s.empty() || s[0] < '0' || s[0] > '9') {
        return std::nullopt;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc()) {
        return std::nullopt;
    }
    s.remove_prefix(static_cast<size_t>(ptr - s.data()));
    return value;
}

// Consume "start[,count]"
bool
consume_range(std::string_view& s, int64_t& start, int64_t& count) {
    auto parsed_start = consume_number(s);
    if (!parsed_start) {
        return false;
    }
    start = *parsed_start;
    count = 1;
    if (!s.empty() && s[0] == ',') {
        s.remove_prefix(1);
        auto parsed_count = consume_number(s);
        if (!parsed_count) {
            return false;
        }
        count = *parsed_count;
    }
    return true;
}

bool
consume_literal(std::string_view& s, std::string_view literal) {
    if (!starts_with(s, literal)) {
        return false;
    }
    s.remove_prefix(literal.size());
    return true;
}

// "@@ -a,b +c,d @@ optional section text"
bool
parse_range_line(std::string_view line, Hunk<std::string>& hunk) {
    std::string_view s = line;
    if (!consume_literal(s, "@@ -"))
        return false;
    if (!consume_range(s, hunk.from_start, hunk.from_count))
        return false;
    if (!consume_literal(s, " +"))
        return false;
    if (!consume_range(s, hunk.to_start, hunk.to_count))
        return false;
    if (!consume_literal(s, " @@"))
        return false;
    return s.empty() || s[0] == ' ';
}

std::vector<std::string_view>
split_patch_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::string_view::size_type start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

}  // namespace internal

bool
patchwork::patch_parse(const std::string& text, ParseResult& result, Patch<std::string>& patch) {
    result = ParseResult{};

    Patch<std::string> parsed;
    const auto lines = internal::split_patch_lines(text);

    // Line number of the range line of the hunk being filled.
    int64_t hunk_line_number = 0;
    std::string hunk_line;
    int64_t seen_from = 0;
    int64_t seen_to = 0;

    auto finish_hunk = [&]() -> bool {
        if (parsed.hunks.empty()) {
            return true;
        }
        const auto& hunk = parsed.hunks.back();
        if (seen_from != hunk.from_count || seen_to != hunk.to_count) {
            result.set_error(ParseErrorKind::CountMismatch,
                             fmt::format("hunk declares {} old and {} new lines, body has {} and {}",
                                         hunk.from_count, hunk.to_count, seen_from, seen_to),
                             hunk_line_number, hunk_line);
            return false;
        }
        return true;
    };

    int64_t line_number = 0;
    for (const auto line : lines) {
        line_number++;
        TRACE("{:>4} | {}\n", line_number, line);

        if (internal::starts_with(line, "@@")) {
            if (!finish_hunk()) {
                return false;
            }

            Hunk<std::string> hunk;
            if (!internal::parse_range_line(line, hunk)) {
                result.set_error(ParseErrorKind::Range, "malformed hunk range", line_number, std::string(line));
                return false;
            }
            if ((hunk.from_start == 0 && hunk.from_count != 0) || (hunk.to_start == 0 && hunk.to_count != 0)) {
                result.set_error(ParseErrorKind::Range, "line numbers start at 1", line_number, std::string(line));
                return false;
            }

            parsed.hunks.push_back(std::move(hunk));
            hunk_line_number = line_number;
            hunk_line = std::string(line);
            seen_from = 0;
            seen_to = 0;
            continue;
        }

        if (parsed.hunks.empty()) {
            // Headers are only accepted before the first hunk, in order.
            if (internal::starts_with(line, "--- ") && !parsed.from_label && !parsed.to_label) {
                parsed.from_label = std::string(line.substr(4));
                continue;
            }
            if (internal::starts_with(line, "+++ ") && !parsed.to_label) {
                parsed.to_label = std::string(line.substr(4));
                continue;
            }
            result.set_error(ParseErrorKind::Header, "expected a file header or a hunk", line_number,
                             std::string(line));
            return false;
        }

        LineKind kind = LineKind::Context;
        switch (line.empty() ? '\0' : line[0]) {
            case ' ':
                kind = LineKind::Context;
                break;
            case '-':
                kind = LineKind::Delete;
                break;
            case '+':
                kind = LineKind::Insert;
                break;
            default:
                result.set_error(ParseErrorKind::LinePrefix, "hunk line must start with ' ', '-' or '+'",
                                 line_number, std::string(line));
                return false;
        }

        if (kind != LineKind::Insert)
            seen_from++;
        if (kind != LineKind::Delete)
            seen_to++;
        parsed.hunks.back().lines.push_back({kind, std::string(line.substr(1))});
    }

    if (!finish_hunk()) {
        return false;
    }

    patch = std::move(parsed);
    return true;
}

bool
patchwork::patch_load_file(const std::string& file_path, ParseResult& result, Patch<std::string>& patch) {
    std::string contents;
    if (!read_file(file_path, contents)) {
        result.set_error(ParseErrorKind::File, fmt::format("failed to read '{}'", file_path));
        return false;
    }
    return patch_parse(contents, result, patch);
}
