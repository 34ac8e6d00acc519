#include <arbor/core/dynamic.hpp>

#include <algorithm>
#include <ostream>

#include <arbor/encodings/yaml.hpp>

namespace arbor {

static char const*
value_type_name(value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            return "nil";
        case value_type::BOOLEAN:
            return "boolean";
        case value_type::INTEGER:
            return "integer";
        case value_type::FLOAT:
            return "float";
        case value_type::STRING:
            return "string";
        case value_type::DATETIME:
            return "datetime";
        case value_type::RECORD:
            return "record";
        case value_type::ARRAY:
            return "array";
        case value_type::MAP:
            return "map";
    }
    ARBOR_THROW(
        invalid_enum_value() << enum_id_info("value_type")
                             << enum_value_info(static_cast<int>(t)));
}

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    return s << value_type_name(t);
}

void
check_type(value_type expected, value_type actual)
{
    if (actual != expected)
    {
        ARBOR_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

// Is :item a two-element array whose first element is a string?
static bool
is_key_value_pair(dynamic const& item)
{
    if (item.type() != value_type::ARRAY)
        return false;
    auto const& pair = cast<dynamic_array>(item);
    return pair.size() == 2 && pair[0].type() == value_type::STRING;
}

dynamic::dynamic(std::initializer_list<dynamic> items)
{
    if (items.size() == 0
        || !std::all_of(items.begin(), items.end(), is_key_value_pair))
    {
        type_ = value_type::ARRAY;
        value_ = dynamic_array(items);
        return;
    }
    dynamic_map map;
    for (auto const& item : items)
    {
        auto const& pair = cast<dynamic_array>(item);
        map[cast<string>(pair[0])] = pair[1];
    }
    type_ = value_type::MAP;
    value_ = std::move(map);
}

bool
operator==(dynamic const& a, dynamic const& b)
{
    return a.type() == b.type()
           && apply_to_dynamic_pair(
               [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator==(dynamic_record const& a, dynamic_record const& b)
{
    return a.tag == b.tag && a.fields == b.fields;
}
bool
operator!=(dynamic_record const& a, dynamic_record const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, dynamic const& v)
{
    return s << value_to_diagnostic_yaml(v);
}

dynamic const*
find_field(dynamic_map const& map, string const& key)
{
    auto field = map.find(key);
    return field != map.end() ? &field->second : nullptr;
}

dynamic const&
get_field(dynamic_map const& map, string const& key)
{
    auto const* field = find_field(map, key);
    if (!field)
        ARBOR_THROW(missing_field() << field_name_info(key));
    return *field;
}

dynamic
make_record(string tag, dynamic_map fields)
{
    return dynamic_record{std::move(tag), std::move(fields)};
}

} // namespace arbor
