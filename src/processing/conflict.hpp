#pragma once

#include <cstdint>
#include <string>

namespace patchwork {

enum class ApplyStatus {
    OK,
    Conflict,
};

// Why and where an application failed.
struct ConflictError {
    // Human readable position, e.g "hunk #2, line 3" or "servers[2].port"
    std::string location;

    int64_t hunk_index = -1;  // index in the caller's hunk list
    int64_t offset = -1;      // line offset inside the hunk
    int64_t position = -1;    // 0-based index into the old sequence

    std::string message;
};

}  // namespace patchwork
