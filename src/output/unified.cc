#include "unified.hpp"

#include <fmt/format.h>

using namespace patchwork;

namespace {

std::string
format_range(const int64_t start, const int64_t count) {
    if (count == 1)
        return fmt::format("{}", start);
    return fmt::format("{},{}", start, count);
}

}  // namespace

std::string
patchwork::unified_range_line(int64_t from_start, int64_t from_count, int64_t to_start, int64_t to_count) {
    return fmt::format("@@ -{} +{} @@", format_range(from_start, from_count), format_range(to_start, to_count));
}

std::string
patchwork::unified_header(const std::optional<std::string>& from_label,
                          const std::optional<std::string>& to_label) {
    if (!from_label && !to_label) {
        return "";
    }
    return fmt::format("--- {}\n+++ {}\n", from_label.value_or("a"), to_label.value_or("b"));
}

char
patchwork::unified_line_prefix(LineKind kind) {
    switch (kind) {
        case LineKind::Context:
            return ' ';
        case LineKind::Delete:
            return '-';
        case LineKind::Insert:
            return '+';
    }
    return ' ';
}
