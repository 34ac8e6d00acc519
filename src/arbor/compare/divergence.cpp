#include <arbor/compare/divergence.hpp>

#include <ostream>

#include <arbor/core/type_interfaces.hpp>
#include <arbor/core/utilities.hpp>

namespace arbor {

static char const* const divergence_kind_names[] = {
    "value_mismatch",
    "missing_key",
    "extra_key",
    "type_mismatch",
    "struct_type_mismatch",
    "datetime_mismatch",
    "list_length_mismatch",
    "unmatched_list_item"};

static size_t const divergence_kind_count
    = sizeof(divergence_kind_names) / sizeof(divergence_kind_names[0]);

std::ostream&
operator<<(std::ostream& s, divergence_kind kind)
{
    auto index = static_cast<int>(kind);
    if (index < 0 || size_t(index) >= divergence_kind_count)
    {
        ARBOR_THROW(
            invalid_enum_value() << enum_id_info("divergence_kind")
                                 << enum_value_info(index));
    }
    s << divergence_kind_names[index];
    return s;
}

divergence_kind
parse_divergence_kind(string const& name)
{
    for (size_t i = 0; i != divergence_kind_count; ++i)
    {
        if (name == divergence_kind_names[i])
            return static_cast<divergence_kind>(i);
    }
    ARBOR_THROW(
        invalid_enum_string() << enum_id_info("divergence_kind")
                              << enum_string_info(name));
}

void
to_dynamic(dynamic* v, divergence_kind x)
{
    *v = lexical_cast<string>(x);
}

void
from_dynamic(divergence_kind* x, dynamic const& v)
{
    *x = parse_divergence_kind(cast<string>(v));
}

value_divergence
make_value_divergence(
    value_path path,
    divergence_kind kind,
    optional<dynamic> expected,
    optional<dynamic> actual)
{
    value_divergence divergence;
    divergence.path = std::move(path);
    divergence.kind = kind;
    divergence.expected = std::move(expected);
    divergence.actual = std::move(actual);
    return divergence;
}

bool
operator==(value_divergence const& a, value_divergence const& b)
{
    return a.path == b.path && a.kind == b.kind && a.expected == b.expected
           && a.actual == b.actual;
}
bool
operator!=(value_divergence const& a, value_divergence const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, value_divergence const& d)
{
    s << to_dynamic(d);
    return s;
}

void
to_dynamic(dynamic* v, value_divergence const& x)
{
    dynamic_map map;
    map["path"] = format_value_path(x.path);
    map["kind"] = to_dynamic(x.kind);
    if (x.expected)
        map["expected"] = *x.expected;
    if (x.actual)
        map["actual"] = *x.actual;
    *v = std::move(map);
}

} // namespace arbor
