#ifndef ARBOR_COMPARE_COMPARE_HPP
#define ARBOR_COMPARE_COMPARE_HPP

#include <vector>

#include <arbor/compare/divergence.hpp>
#include <arbor/compare/options.hpp>

namespace arbor {

// STRUCTURAL COMPARISON - Compare two dynamic values and report where (and
// why) they differ.
//
// The rules are applied by the shape of the pair being compared, in this
// order:
// * two datetimes are equal if they refer to the same instant (to the
//   second, if truncate_timestamp_subsecond is set)
// * two records must have the same tag, and then their fields are compared
//   as maps
// * a record is never equal to a non-record
// * two maps must have the same keys, and the values under each key must
//   be equal
// * two arrays must have the same length and their items must be equal,
//   either position-by-position (strict_list_order) or under some pairing
// * an array is never equal to a non-array
// * anything else is compared as a scalar: the types must match, except
//   that integers and floats are equal if they're mathematically equal

struct comparison_result
{
    // Did the two values match?
    bool
    success() const
    {
        return divergences.empty();
    }

    // In first-divergence mode, this is the rendered error message for the
    // divergence that was found (if any).
    optional<string> message;

    // In first-divergence mode, this holds the one divergence that was found
    // (if any). In exhaustive mode, it holds every divergence.
    std::vector<value_divergence> divergences;
};

// Compare :a (the expected value) against :b (the actual value).
comparison_result
compare(
    dynamic const& a,
    dynamic const& b,
    comparison_options const& options = comparison_options());

// Find the first divergence between :a and :b.
// (:options.exhaustive is ignored.)
optional<value_divergence>
find_first_divergence(
    dynamic const& a,
    dynamic const& b,
    comparison_options const& options = comparison_options());

// Find every divergence between :a and :b.
// (:options.exhaustive is ignored.)
std::vector<value_divergence>
collect_divergences(
    dynamic const& a,
    dynamic const& b,
    comparison_options const& options = comparison_options());

// Do :a and :b match under the given options?
bool
values_match(
    dynamic const& a,
    dynamic const& b,
    comparison_options const& options = comparison_options());

// Replace every occurrence of %{path} in :error_template with :path.
// A template without the placeholder is returned unchanged.
string
render_error_message(string const& error_template, string const& path);

// Thrown when the values being compared are nested more deeply than
// comparison_options::max_depth allows.
ARBOR_DEFINE_EXCEPTION(nesting_too_deep)
ARBOR_DEFINE_ERROR_INFO(size_t, depth_limit)
ARBOR_DEFINE_ERROR_INFO(string, nesting_path)

} // namespace arbor

#endif
