#include "config.hpp"

#include "structural/value_parser.hpp"
#include "structural/value_serializer.hpp"
#include "util/parse_result.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

using namespace patchwork;

namespace {

const std::string config_doc_general = R"foo(# General configuration for `patchwork`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   default_mode = 'unified'  # unified, structural or edits
#
)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    Mode,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return ConfigLoadResult::DoesNotExist;
    }
    if (!value_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Invalid;
    }
    return ConfigLoadResult::Ok;
}

void
config_save(const std::string& config_root, const std::string& config_path, const Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "warning: failed to create '{}': {}\n", config_root, ec.message());
        return;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "warning: failed to open '{}' for writing: {}\n", config_path, strerror(errno));
        return;
    }

    std::string serialized = config_doc_general + value_serialize_document(config_value);
    if (fwrite(serialized.data(), 1, serialized.size(), f) != serialized.size()) {
        fmt::print(stderr, "warning: failed to write '{}'\n", config_path);
    }
    fclose(f);
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

}  // namespace

std::string
patchwork::config_get_directory() {
    return fmt::format("{}/patchwork", sago::getConfigHome());
}

std::vector<std::string>
patchwork::config_sync_options(Value& config, ProgramOptions& program_options) {
    std::vector<std::string> problems;

    // clang-format off
    const OptionVector options = {
       { "general.default_mode",        ConfigVariableType::Mode, &program_options.mode },
       { "general.context_lines",       ConfigVariableType::Int,  &program_options.context_lines },
       { "general.ignore_line_endings", ConfigVariableType::Bool, &program_options.ignore_line_endings },
       { "general.show_summary",        ConfigVariableType::Bool, &program_options.show_summary },
    };
    // clang-format on

    if (!config.is_table()) {
        config = Value{Value::Table{}};
    }

    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (const Value* stored_value = config.lookup_value_by_path(path); stored_value) {
            // Yes. So we take the value and write it into our settings struct.
            bool ok = false;
            switch (type) {
                case ConfigVariableType::Bool: {
                    if ((ok = stored_value->is_bool()))
                        *static_cast<bool*>(ptr) = stored_value->as_bool();
                } break;
                case ConfigVariableType::Int: {
                    if ((ok = stored_value->is_int() && stored_value->as_int() >= 0))
                        *static_cast<int64_t*>(ptr) = stored_value->as_int();
                } break;
                case ConfigVariableType::Mode: {
                    if (stored_value->is_string()) {
                        const auto mode = mode_from_string(stored_value->as_string());
                        // Applying needs a patch file, so it can't be the default.
                        if ((ok = mode != Mode::kInvalid && mode != Mode::kApply))
                            *static_cast<Mode*>(ptr) = mode;
                    }
                } break;
            }
            if (!ok) {
                problems.push_back(
                    fmt::format("ignoring invalid value {} for '{}'", value_serialize(*stored_value), path));
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            bool stored = false;
            switch (type) {
                case ConfigVariableType::Bool: {
                    stored = config.set_value_at(path, Value{Value::Bool{*static_cast<bool*>(ptr)}});
                } break;
                case ConfigVariableType::Int: {
                    stored = config.set_value_at(path, Value{Value::Int{*static_cast<int64_t*>(ptr)}});
                } break;
                case ConfigVariableType::Mode: {
                    stored = config.set_value_at(path, Value{Value::String{repr(*static_cast<Mode*>(ptr))}});
                } break;
            }
            if (!stored) {
                problems.push_back(fmt::format("'{}' is not inside a table", path));
            }
        }
    }

    return problems;
}

void
patchwork::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "patchwork.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value{Value::Table{}};
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
            // yay!
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "warning: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            // Use the defaults, but don't overwrite the user's file.
            return;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            flush_config_to_disk = true;
        } break;
    };

    for (const auto& problem : config_sync_options(config_file_table_value, program_options)) {
        fmt::print(stderr, "warning: {}\n\tin: {}\n", problem, config_path);
    }

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_save(config_root, config_path, config_file_table_value);
    }
}

bool
patchwork::context_lines_from_string(const std::string& s, int64_t& context_lines) {
    if (s.empty() || !isdigit(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return false;
    }
    context_lines = value;
    return true;
}

Mode
patchwork::mode_from_string(const std::string& s) {
    if (s == "u" || s == "unified" || s == "default")
        return Mode::kUnified;
    else if (s == "s" || s == "structural")
        return Mode::kStructural;
    else if (s == "p" || s == "apply")
        return Mode::kApply;
    else if (s == "e" || s == "edits")
        return Mode::kEdits;
    return Mode::kInvalid;
}

std::string
patchwork::repr(Mode mode) {
    switch (mode) {
        case Mode::kUnified:
            return "unified";
        case Mode::kStructural:
            return "structural";
        case Mode::kApply:
            return "apply";
        case Mode::kEdits:
            return "edits";
        case Mode::kInvalid:
            break;
    }
    return "invalid";
}
