#pragma once

/*
    Unified diff parser.

    Accepts the dialect written by `unified_diff_render`: an optional
    `--- old` / `+++ new` header pair, followed by hunks. Each hunk starts
    with a range line, `@@ -a,b +c,d @@`, where a missing count means 1
    and anything after the closing `@@` is ignored. Body lines start with
    ' ', '-' or '+'; the number of body lines must match the counts given
    in the range line.

    "\ No newline at end of file" markers are not supported.
*/

#include "processing/diff_hunk.hpp"
#include "util/parse_result.hpp"

#include <string>

namespace patchwork {

// Parse `text` into `patch`. On failure `patch` is left untouched and
// `result` describes the first problem found.
bool
patch_parse(const std::string& text, ParseResult& result, Patch<std::string>& patch);

bool
patch_load_file(const std::string& file_path, ParseResult& result, Patch<std::string>& patch);

}  // namespace patchwork
