#pragma once

#include "structural/value.hpp"

#include <string>

namespace patchwork {

// Serialize any value on a single line, e.g `{a = 1, b = ['x', 'y']}`.
// Does not output sections.
std::string
value_serialize(const Value& value);

// Serialize all entries in the given table. Non-table entries of the root
// come first, then a [section] per table; nested tables get dotted section
// headers. The input Value must hold a Value::Table.
std::string
value_serialize_document(const Value& value);

}  // namespace patchwork
