#include "algorithms/myers_greedy.hpp"
#include "config/config.hpp"
#include "output/edit_dump.hpp"
#include "output/unified.hpp"
#include "processing/diff_hunk.hpp"
#include "processing/patch_apply.hpp"
#include "processing/patch_parser.hpp"
#include "structural/structural_diff.hpp"
#include "structural/value_parser.hpp"
#include "util/parse_result.hpp"
#include "util/readlines.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <gsl/span>
#include <string>
#include <vector>

#ifndef PATCHWORK_VERSION
#define PATCHWORK_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace {

enum ExitStatus {
    kExitSame = 0,
    kExitDifferent = 1,
    kExitError = 2,
};

enum class FileStatus {
    kOk,
    kNullPath,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path) {
    if (path.empty() || path == "/dev/null" || path == "nul") {
        return FileStatus::kNullPath;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_symlink(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus error_code) {
    switch (error_code) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::kNoPermission:
            return "File is not readable (no permission)";
        case FileStatus::kNullPath:
            return "Null path";
    }
    return "Unknown error";
}

// Null paths read as empty files.
bool
load_lines(const std::string& path, bool ignore_line_endings, std::vector<patchwork::Line>& lines) {
    if (check_file_status(path) == FileStatus::kNullPath) {
        lines.clear();
        return true;
    }
    if (!patchwork::readlines(path, lines, ignore_line_endings)) {
        fmt::print(stderr, "error: could not read '{}'\n", path);
        return false;
    }
    return true;
}

bool
load_document(const std::string& path, patchwork::Value& document) {
    if (check_file_status(path) == FileStatus::kNullPath) {
        document = patchwork::Value{patchwork::Value::Table{}};
        return true;
    }
    patchwork::ParseResult result;
    if (!patchwork::value_load_file(path, result, document)) {
        fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", result.error, path);
        return false;
    }
    return true;
}

void
print_summary(const patchwork::EditScriptStats& stats) {
    fmt::print("{} equal, {} deleted, {} inserted\n", stats.equal, stats.deleted, stats.inserted);
}

int
run_line_diff(const patchwork::ProgramOptions& opts) {
    std::vector<patchwork::Line> left_lines;
    std::vector<patchwork::Line> right_lines;
    if (!load_lines(opts.left_file, opts.ignore_line_endings, left_lines) ||
        !load_lines(opts.right_file, opts.ignore_line_endings, right_lines)) {
        return kExitError;
    }

    patchwork::DiffInput<patchwork::Line> diff_input{gsl::span<const patchwork::Line>{left_lines},
                                                     gsl::span<const patchwork::Line>{right_lines},
                                                     opts.left_file, opts.right_file};
    auto result = patchwork::MyersGreedy<patchwork::Line>(diff_input).compute();
    auto stats = patchwork::edit_script_stats(result.edit_script);

    if (opts.mode == patchwork::Mode::kEdits) {
        fmt::print("{}", patchwork::edit_dump_render(result.edit_script));
    } else if (result.status != patchwork::DiffResultStatus::NoChanges) {
        auto hunks = patchwork::compose_hunks(result.edit_script, opts.context_lines);
        auto old_label = opts.old_label.value_or(opts.left_file);
        auto new_label = opts.new_label.value_or(opts.right_file);
        fmt::print("{}", patchwork::unified_diff_render(hunks, old_label, new_label));
    }

    if (opts.show_summary) {
        print_summary(stats);
    }

    return stats.deleted + stats.inserted > 0 ? kExitDifferent : kExitSame;
}

int
run_structural_diff(const patchwork::ProgramOptions& opts) {
    patchwork::Value left_document;
    patchwork::Value right_document;
    if (!load_document(opts.left_file, left_document) || !load_document(opts.right_file, right_document)) {
        return kExitError;
    }

    auto change = patchwork::structural_diff(left_document, right_document);
    if (change.is_no_change()) {
        return kExitSame;
    }

    fmt::print("{}", patchwork::structural_change_render(change));
    return kExitDifferent;
}

int
run_apply(const patchwork::ProgramOptions& opts) {
    patchwork::ParseResult parse_result;
    patchwork::Patch<std::string> patch;
    if (!patchwork::patch_load_file(opts.patch_file, parse_result, patch)) {
        if (parse_result.line_number > 0) {
            fmt::print(stderr, "error: {}:{}: {}\n", opts.patch_file, parse_result.line_number, parse_result.error);
        } else {
            fmt::print(stderr, "error: {}\n", parse_result.error);
        }
        return kExitError;
    }

    std::string contents;
    if (check_file_status(opts.left_file) != FileStatus::kNullPath && !patchwork::read_file(opts.left_file, contents)) {
        fmt::print(stderr, "error: could not read '{}'\n", opts.left_file);
        return kExitError;
    }

    const auto lines = patchwork::split_lines(contents, opts.ignore_line_endings);
    auto result = patchwork::patch_apply(lines, patch);
    if (!result.is_ok()) {
        fmt::print(stderr, "error: {}: {}: {}\n", opts.left_file, result.conflict.location, result.conflict.message);
        return kExitError;
    }

    fmt::print("{}", patchwork::join_lines(result.output));
    return kExitSame;
}

}  // namespace

int
main(int argc, char* argv[]) {
    patchwork::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format((R"(
Usage: {0} [options] old_file new_file
       {0} --apply patch_file file

Compare files line by line, or as structured documents

Options:
    -h, --help                   show this help and exit
    -v, --version                show program version and exit
    -u, -U [context_lines]       show unified output, optional context line count
    -s, --structural             compare the files as value documents
    -e, --edits                  dump the raw edit script
    -p, --apply [patch_file]     apply a unified diff to a file, write the result to stdout
    -S, --summary                print the number of equal, deleted and inserted lines

    -o, --old-label [label]      label for the old file in the unified header
    -n, --new-label [label]      label for the new file in the unified header

    -i, --ignore-line-endings    ignore changes to line endings
    -I, --no-ignore-line-endings inverse of --ignore-line-endings

Exit status is 0 if the inputs are the same, 1 if they differ and 2 on error.
)"),
                                       argv[0]);

        help += "\n";

        help += "Config directory:\n    " + patchwork::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            fmt::print(stderr, "{}\n", optional_error_message);
        }
        fmt::print("{}", help);
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"unified", required_argument, 0, 'U'},
                                               {"structural", no_argument, 0, 's'},
                                               {"edits", no_argument, 0, 'e'},
                                               {"apply", required_argument, 0, 'p'},
                                               {"summary", no_argument, 0, 'S'},
                                               {"old-label", required_argument, 0, 'o'},
                                               {"new-label", required_argument, 0, 'n'},
                                               {"ignore-line-endings", no_argument, 0, 'i'},
                                               {"no-ignore-line-endings", no_argument, 0, 'I'},
                                               {0, 0, 0, 0}};
        bool mode_given = false;
        auto set_mode = [&](patchwork::Mode mode) {
            if (mode_given && opts.mode != mode) {
                show_help("error: -u, -s, -e and -p are mutually exclusive");
                return false;
            }
            mode_given = true;
            opts.mode = mode;
            return true;
        };

        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvuU:sep:So:n:iI", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    opts.version = true;
                    return true;
                case 'h':
                    opts.help = true;
                    return true;
                case 'u':
                    if (!set_mode(patchwork::Mode::kUnified))
                        return false;
                    break;
                case 'U':
                    if (!set_mode(patchwork::Mode::kUnified))
                        return false;
                    if (!patchwork::context_lines_from_string(optarg, opts.context_lines)) {
                        show_help(fmt::format("error: invalid value for -{} ({})", static_cast<char>(c), optarg));
                        return false;
                    }
                    break;
                case 's':
                    if (!set_mode(patchwork::Mode::kStructural))
                        return false;
                    break;
                case 'e':
                    if (!set_mode(patchwork::Mode::kEdits))
                        return false;
                    break;
                case 'p':
                    if (!set_mode(patchwork::Mode::kApply))
                        return false;
                    opts.patch_file = optarg;
                    break;
                case 'S':
                    opts.show_summary = true;
                    break;
                case 'o':
                    opts.old_label = optarg;
                    break;
                case 'n':
                    opts.new_label = optarg;
                    break;
                case 'i':
                    opts.ignore_line_endings = true;
                    break;
                case 'I':
                    opts.ignore_line_endings = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        const int positional_count = in_argc - optind;
        const int expected_count = opts.mode == patchwork::Mode::kApply ? 1 : 2;

        if (positional_count != expected_count) {
            show_help(positional_count < expected_count ? "error: missing positional arguments"
                                                        : "error: too many positional arguments");
            return false;
        }

        opts.left_file = in_argv[optind];
        if (expected_count == 2) {
            opts.right_file = in_argv[optind + 1];
        }

        std::vector<std::string> paths{opts.left_file};
        if (expected_count == 2) {
            paths.push_back(opts.right_file);
        } else {
            paths.push_back(opts.patch_file);
        }

        std::string err;
        for (const auto& path : paths) {
            // Null paths will be readable
            auto status = check_file_status(path);
            if (status != FileStatus::kOk && status != FileStatus::kNullPath) {
                err += fmt::format("error: '{}': {}\n", path, to_string(status));
            }
        }
        if (!err.empty()) {
            fmt::print(stderr, "{}", err);
            return false;
        }
        return true;
    };

    // Load the global defaults before we override them with command line args
    patchwork::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return kExitError;
    }

    if (opts.help) {
        show_help("");
        return kExitSame;
    }

    if (opts.version) {
        fmt::print("version: {}\n", PATCHWORK_VERSION);
        return kExitSame;
    }

    switch (opts.mode) {
        case patchwork::Mode::kUnified:
        case patchwork::Mode::kEdits:
            return run_line_diff(opts);
        case patchwork::Mode::kStructural:
            return run_structural_diff(opts);
        case patchwork::Mode::kApply:
            return run_apply(opts);
        case patchwork::Mode::kInvalid:
            break;
    }

    fmt::print(stderr, "error: invalid mode\n");
    return kExitError;
}
