#ifndef ARBOR_ENCODINGS_YAML_HPP
#define ARBOR_ENCODINGS_YAML_HPP

#include <arbor/core/dynamic.hpp>

namespace arbor {

// Render :v as YAML for logs and error reports.
// Records are written as flow maps carrying their tag as a local tag
// (e.g., "!point {x: 1, y: 2}"). Datetimes are quoted ISO 8601 strings, and
// strings that would otherwise read back as some other scalar are quoted.
// Arrays and maps with more than :max_items entries are summarized by their
// size.
string
value_to_diagnostic_yaml(dynamic const& v, size_t max_items = 63);

} // namespace arbor

#endif
