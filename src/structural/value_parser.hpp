#pragma once

/*
    Value document parser

    It's basically "INI with arrays, tables, strings, ints and bools". The
    syntax is similar to simple TOML:

        # comment
        name = 'patchwork'          // comment

        [general]
            context_lines = 3
            labels = ['old', "new"]

        [servers.alpha]
            endpoint = { host = 'localhost', port = 8080, },

    Section headers may be dotted; each component names a nested table.
    Booleans are written true/false or on/off. Trailing commas are
    accepted in arrays and inline tables.
*/

#include "structural/value.hpp"
#include "util/parse_result.hpp"

#include <string>

namespace patchwork {

// Parse a document of `key = value` entries and `[section]` headers. The
// result is always a table.
bool
value_parse_document(const std::string& input_data, ParseResult& result, Value& result_obj);

// Parse a single value, e.g `[1, 2]` or `{ a = 1 }`. A bare list of
// `key = value` pairs, e.g `fg = 'white', bg = 'default'`, is read as a table.
bool
value_parse(const std::string& input_data, ParseResult& result, Value& result_obj);

// Load a file and parse it as a document.
bool
value_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

}  // namespace patchwork
