#ifndef ARBOR_COMPARE_OPTIONS_HPP
#define ARBOR_COMPARE_OPTIONS_HPP

#include <arbor/core/dynamic.hpp>

namespace arbor {

// comparison_options configures a single call to compare().
// A default-constructed instance gives the default behavior.
struct comparison_options
{
    // Must arrays have identical order to be considered equal?
    bool strict_list_order = false;

    // Should the sub-second component of datetimes be ignored?
    bool truncate_timestamp_subsecond = true;

    // Should every divergence be collected rather than just the first?
    bool exhaustive = false;

    // the failure message produced in first-divergence mode
    // Every occurrence of %{path} is replaced with the path where the values
    // diverged.
    string error_template = "Submitted values do not match: %{path}";

    // the deepest level of nesting that the comparison will descend into
    // before giving up with a nesting_too_deep exception
    size_t max_depth = 1024;
};

bool
operator==(comparison_options const& a, comparison_options const& b);
bool
operator!=(comparison_options const& a, comparison_options const& b);

std::ostream&
operator<<(std::ostream& s, comparison_options const& options);

// Options are represented dynamically as a map whose keys are the field
// names above. When reading options, omitted fields take their default
// values and nil is treated as an empty map.
void
to_dynamic(dynamic* v, comparison_options const& x);

void
from_dynamic(comparison_options* x, dynamic const& v);

// Thrown when reading options that contain an unrecognized field.
ARBOR_DEFINE_EXCEPTION(unknown_option)
ARBOR_DEFINE_ERROR_INFO(string, option_name)

// Read options from YAML text (e.g., "strict_list_order: true").
comparison_options
parse_comparison_options(string const& yaml);

} // namespace arbor

#endif
