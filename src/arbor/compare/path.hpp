#ifndef ARBOR_COMPARE_PATH_HPP
#define ARBOR_COMPARE_PATH_HPP

#include <vector>

#include <arbor/core/dynamic.hpp>

namespace arbor {

// value_path represents the path from the root of a value to some point
// within it.
// Path elements can either be strings or nonnegative integers.
// Strings represent map (or record) field names.
// Integers represent array indices.
// The root of a value is represented by an empty path.
typedef std::vector<dynamic> value_path;

ARBOR_DEFINE_EXCEPTION(invalid_path_element)
ARBOR_DEFINE_ERROR_INFO(dynamic, path_element)

// Render a path as a string.
// Field names are joined with dots and indices are bracketed, so the path
// {"a", "b", 2, "c"} becomes "a.b[2].c". The root path is rendered as "".
string
format_value_path(value_path const& path);

} // namespace arbor

#endif
