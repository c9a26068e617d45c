#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace patchwork {

// A line of text without its '\n' terminator. The checksum is compared
// first, so unequal lines are usually rejected without a string compare.
struct Line {
    uint32_t line_number;
    uint32_t checksum;

    std::string text;

    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && text == other.text;
    }

    bool
    operator!=(const Line& other) const {
        return !(*this == other);
    }
};

// Split text on '\n'. A trailing newline does not produce an extra empty
// line. With `ignore_line_endings` a '\r' before the '\n' is dropped.
std::vector<std::string>
split_lines(const std::string& text, bool ignore_line_endings = false);

// Join lines, terminating each with '\n'.
std::string
join_lines(const std::vector<std::string>& lines);

bool
parselines(const std::string& input_text, std::vector<Line>& lines, bool ignore_line_endings);

bool
readlines(const std::string& path, std::vector<Line>& lines, bool ignore_line_endings);

bool
read_file(const std::string& path, std::string& contents);

std::vector<std::string>
line_texts(const std::vector<Line>& lines);

}  // namespace patchwork

template <>
struct fmt::formatter<patchwork::Line> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto
    format(const patchwork::Line& line, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(std::string_view{line.text}, ctx);
    }
};
