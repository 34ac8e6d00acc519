#ifndef ARBOR_CORE_TYPE_INTERFACES_HPP
#define ARBOR_CORE_TYPE_INTERFACES_HPP

#include <cstddef>

#include <arbor/core/dynamic.hpp>

// to_dynamic/from_dynamic for the C++ types that arbor's own structures
// (options, divergences) are built from.

namespace arbor {

void
to_dynamic(dynamic* v, bool x);
void
from_dynamic(bool* x, dynamic const& v);

void
to_dynamic(dynamic* v, integer x);
void
from_dynamic(integer* x, dynamic const& v);

// Sizes and counts are stored as integers. Reading one back fails (with
// boost::numeric::bad_numeric_cast) if the integer is negative.
void
to_dynamic(dynamic* v, std::size_t x);
void
from_dynamic(std::size_t* x, dynamic const& v);

// Integral floats are also accepted as integers, and vice versa.
void
to_dynamic(dynamic* v, double x);
void
from_dynamic(double* x, dynamic const& v);

void
to_dynamic(dynamic* v, string const& x);
void
from_dynamic(string* x, dynamic const& v);

// DATETIMES

// Format :t as ISO 8601 with microsecond precision
// (e.g., "2017-04-26T01:02:03.456000Z").
string
to_value_string(ptime const& t);

// Parse an ISO 8601 datetime (e.g., "2017-04-26T01:02:03.456Z").
// A UTC offset ("+02:00", "-0530", "+01") may stand in for the 'Z', in which
// case the result is shifted to UTC.
ptime
parse_ptime(string const& s);

void
to_dynamic(dynamic* v, ptime const& x);
// Strings are also accepted here if they parse as datetimes.
void
from_dynamic(ptime* x, dynamic const& v);

} // namespace arbor

#endif
