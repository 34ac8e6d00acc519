#include <arbor/compare/options.hpp>

#include <algorithm>
#include <ostream>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <arbor/core/type_interfaces.hpp>

namespace arbor {

bool
operator==(comparison_options const& a, comparison_options const& b)
{
    return a.strict_list_order == b.strict_list_order
           && a.truncate_timestamp_subsecond == b.truncate_timestamp_subsecond
           && a.exhaustive == b.exhaustive
           && a.error_template == b.error_template
           && a.max_depth == b.max_depth;
}
bool
operator!=(comparison_options const& a, comparison_options const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, comparison_options const& options)
{
    s << to_dynamic(options);
    return s;
}

static char const* const option_names[] = {
    "strict_list_order",
    "truncate_timestamp_subsecond",
    "exhaustive",
    "error_template",
    "max_depth"};

void
to_dynamic(dynamic* v, comparison_options const& x)
{
    dynamic_map map;
    to_dynamic(&map["strict_list_order"], x.strict_list_order);
    to_dynamic(
        &map["truncate_timestamp_subsecond"], x.truncate_timestamp_subsecond);
    to_dynamic(&map["exhaustive"], x.exhaustive);
    to_dynamic(&map["error_template"], x.error_template);
    to_dynamic(&map["max_depth"], x.max_depth);
    *v = std::move(map);
}

void
from_dynamic(comparison_options* x, dynamic const& v)
{
    comparison_options options;
    if (v.type() != value_type::NIL)
    {
        auto const& map = cast<dynamic_map>(v);
        for (auto const& field : map)
        {
            if (std::find(
                    std::begin(option_names),
                    std::end(option_names),
                    field.first)
                == std::end(option_names))
            {
                ARBOR_THROW(unknown_option() << option_name_info(field.first));
            }
        }
        read_optional_field(
            &options.strict_list_order, map, "strict_list_order");
        read_optional_field(
            &options.truncate_timestamp_subsecond,
            map,
            "truncate_timestamp_subsecond");
        read_optional_field(&options.exhaustive, map, "exhaustive");
        read_optional_field(&options.error_template, map, "error_template");
        read_optional_field(&options.max_depth, map, "max_depth");
    }
    *x = std::move(options);
}

// Read the YAML scalar given for the option :name. The option's default
// value determines what type the scalar is read as.
static dynamic
read_yaml_option(
    string const& name, YAML::Node const& node, dynamic const& default_value)
{
    if (!node.IsScalar())
    {
        ARBOR_THROW(
            parsing_error() << expected_format_info("YAML scalar")
                            << parsed_text_info(name)
                            << parsing_error_info("options must be scalars"));
    }
    auto const type = default_value.type();
    try
    {
        if (type == value_type::BOOLEAN)
            return node.as<bool>();
        if (type == value_type::INTEGER)
            return node.as<integer>();
        return node.as<string>();
    }
    catch (YAML::BadConversion&)
    {
        ARBOR_THROW(
            type_mismatch() << expected_value_type_info(type)
                            << actual_value_type_info(value_type::STRING));
    }
}

comparison_options
parse_comparison_options(string const& yaml)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml);
    }
    catch (YAML::Exception& e)
    {
        ARBOR_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(yaml)
                            << parsing_error_info(e.what()));
    }
    if (root.IsNull())
        return comparison_options();
    if (!root.IsMap())
    {
        ARBOR_THROW(
            parsing_error() << expected_format_info("YAML map")
                            << parsed_text_info(yaml));
    }

    auto const defaults = cast<dynamic_map>(to_dynamic(comparison_options()));
    dynamic_map fields;
    for (auto const& entry : root)
    {
        auto const name = entry.first.as<string>();
        auto const* default_value = find_field(defaults, name);
        if (!default_value)
            ARBOR_THROW(unknown_option() << option_name_info(name));
        fields[name] = read_yaml_option(name, entry.second, *default_value);
    }
    return from_dynamic<comparison_options>(fields);
}

} // namespace arbor
