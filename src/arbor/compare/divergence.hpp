#ifndef ARBOR_COMPARE_DIVERGENCE_HPP
#define ARBOR_COMPARE_DIVERGENCE_HPP

#include <vector>

#include <arbor/compare/path.hpp>

namespace arbor {

enum class divergence_kind
{
    // two scalars (or otherwise incomparable values) differ
    VALUE_MISMATCH,
    // a field of the first map is absent from the second
    MISSING_KEY,
    // a field of the second map is absent from the first
    EXTRA_KEY,
    // exactly one side is a record, or exactly one side is an array
    TYPE_MISMATCH,
    // both sides are records, but with different tags
    STRUCT_TYPE_MISMATCH,
    // two datetimes refer to different instants
    DATETIME_MISMATCH,
    // two arrays have different lengths
    LIST_LENGTH_MISMATCH,
    // an array item couldn't be paired with an item in the other array
    UNMATCHED_LIST_ITEM
};

// Streams the lowercase name of the kind (e.g., "missing_key").
std::ostream&
operator<<(std::ostream& s, divergence_kind kind);

// Get the kind with the given (lowercase) name.
divergence_kind
parse_divergence_kind(string const& name);

void
to_dynamic(dynamic* v, divergence_kind x);

void
from_dynamic(divergence_kind* x, dynamic const& v);

// value_divergence describes one difference found between two values.
// :expected comes from the first value and :actual from the second.
// A MISSING_KEY divergence only has :expected, an EXTRA_KEY divergence only
// has :actual, and a VALUE_MISMATCH always has both.
struct value_divergence
{
    value_path path;

    divergence_kind kind;

    optional<dynamic> expected, actual;
};

value_divergence
make_value_divergence(
    value_path path,
    divergence_kind kind,
    optional<dynamic> expected,
    optional<dynamic> actual);

bool
operator==(value_divergence const& a, value_divergence const& b);
bool
operator!=(value_divergence const& a, value_divergence const& b);

std::ostream&
operator<<(std::ostream& s, value_divergence const& d);

// A divergence is represented dynamically as a map with the rendered path,
// the kind, and whichever of 'expected' and 'actual' are present.
void
to_dynamic(dynamic* v, value_divergence const& x);

} // namespace arbor

#endif
