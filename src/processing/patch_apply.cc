#include "patch_apply.hpp"

#include <fmt/format.h>

using namespace patchwork;

ConflictError
patchwork::make_hunk_conflict(int64_t hunk_index,
                              int64_t offset,
                              int64_t position,
                              const std::string& message) {
    ConflictError conflict;
    conflict.location = fmt::format("hunk #{}, line {}", hunk_index + 1, offset + 1);
    conflict.hunk_index = hunk_index;
    conflict.offset = offset;
    conflict.position = position;
    conflict.message = fmt::format("{} (input line {})", message, position + 1);
    return conflict;
}
