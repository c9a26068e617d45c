#pragma once

#include "structural/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchwork {

enum class Mode { kInvalid, kUnified, kStructural, kApply, kEdits };

Mode
mode_from_string(const std::string& s);

std::string
repr(Mode mode);

// Parse a non-negative decimal context line count. Fails on anything else,
// including values that don't fit an int64_t.
bool
context_lines_from_string(const std::string& s, int64_t& context_lines);

struct ProgramOptions {
    bool help = false;
    bool version = false;
    bool show_summary = false;
    bool ignore_line_endings = true;

    Mode mode = Mode::kUnified;
    int64_t context_lines = 3;

    std::optional<std::string> old_label;
    std::optional<std::string> new_label;

    // Unified diff to apply in Mode::kApply
    std::string patch_file;

    std::string left_file;
    std::string right_file;
};

// <config home>/patchwork
std::string
config_get_directory();

// Read the options stored in `config` into `program_options`. Options
// missing from `config` are added to it with their current value. Returns
// one message per stored value that could not be used.
std::vector<std::string>
config_sync_options(Value& config, ProgramOptions& program_options);

// Load `patchwork.conf` from the config directory and apply it. The file
// is created with the default values if it doesn't exist.
void
config_apply_options(ProgramOptions& program_options);

}  // namespace patchwork
