#include "readlines.hpp"

#include "util/hash.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace internal {

void
strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace internal

std::vector<std::string>
patchwork::split_lines(const std::string& text, bool ignore_line_endings) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (ignore_line_endings) {
            internal::strip_carriage_return(line);
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

std::string
patchwork::join_lines(const std::vector<std::string>& lines) {
    std::string output;
    for (const auto& line : lines) {
        output += line;
        output += '\n';
    }
    return output;
}

bool
patchwork::parselines(const std::string& input_text, std::vector<Line>& lines, bool ignore_line_endings) {
    lines.clear();
    uint32_t line_number = 1;
    for (auto& text : split_lines(input_text, ignore_line_endings)) {
        uint32_t checksum = hash::hash(text);
        lines.push_back({line_number, checksum, std::move(text)});
        line_number++;
    }
    return true;
}

bool
patchwork::read_file(const std::string& path, std::string& contents) {
    contents.clear();

    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        return false;
    }

    char buffer[4096];
    std::size_t count = 0;
    while ((count = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        contents.append(buffer, count);
    }

    const bool ok = ferror(stream) == 0;
    fclose(stream);
    return ok;
}

bool
patchwork::readlines(const std::string& path, std::vector<Line>& lines, bool ignore_line_endings) {
    lines.clear();

    std::string contents;
    if (!read_file(path, contents)) {
        return false;
    }

    return parselines(contents, lines, ignore_line_endings);
}

std::vector<std::string>
patchwork::line_texts(const std::vector<Line>& lines) {
    std::vector<std::string> texts;
    texts.reserve(lines.size());
    for (const auto& line : lines) {
        texts.push_back(line.text);
    }
    return texts;
}
