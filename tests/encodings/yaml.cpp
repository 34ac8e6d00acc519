#include <arbor/encodings/yaml.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

#include <arbor/core/testing.hpp>
#include <arbor/core/type_interfaces.hpp>
#include <arbor/core/utilities.hpp>

using namespace arbor;

using boost::gregorian::date;

static string
strip_whitespace(string s)
{
    s.erase(
        std::remove_if(
            s.begin(),
            s.end(),
            [](char c) { return std::isspace(static_cast<unsigned char>(c)); }),
        s.end());
    return s;
}

// Check the diagnostic YAML for :value, ignoring whitespace.
static void
check_diagnostic_yaml(
    dynamic const& value, string const& expected_yaml, size_t max_items = 63)
{
    auto yaml = value_to_diagnostic_yaml(value, max_items);
    CAPTURE(yaml);
    REQUIRE(strip_whitespace(yaml) == strip_whitespace(expected_yaml));
}

TEST_CASE("diagnostic YAML scalars", "[encodings][yaml]")
{
    check_diagnostic_yaml(nil, "~");
    check_diagnostic_yaml(false, "false");
    check_diagnostic_yaml(integer(-12), "-12");
    check_diagnostic_yaml(0.5, "0.5");
    check_diagnostic_yaml("xyz", "xyz");

    check_diagnostic_yaml(
        ptime(
            date(2017, boost::gregorian::Apr, 26),
            boost::posix_time::time_duration(1, 2, 3)),
        "\"2017-04-26T01:02:03.000000Z\"");
}

TEST_CASE("diagnostic YAML quoting", "[encodings][yaml]")
{
    // Strings that a reader would take for something else are quoted, so
    // that "12" and 12 don't look alike in a report.
    check_diagnostic_yaml("true", "\"true\"");
    check_diagnostic_yaml("No", "\"No\"");
    check_diagnostic_yaml("null", "\"null\"");
    check_diagnostic_yaml("12", "\"12\"");
    check_diagnostic_yaml("-1.5", "\"-1.5\"");
    check_diagnostic_yaml("0x1f", "\"0x1f\"");
    check_diagnostic_yaml("", "\"\"");
    check_diagnostic_yaml(
        "2017-04-26T01:02:03Z", "\"2017-04-26T01:02:03Z\"");

    // These are just strings.
    check_diagnostic_yaml("12 apples", "12 apples");
    check_diagnostic_yaml("2017-04-26", "2017-04-26");
}

TEST_CASE("diagnostic YAML containers", "[encodings][yaml]")
{
    check_diagnostic_yaml(
        dynamic({integer(1), integer(2)}),
        R"(
            - 1
            - 2
        )");

    check_diagnostic_yaml(
        dynamic({{"b", "xyz"}, {"a", integer(1)}}),
        R"(
            a: 1
            b: xyz
        )");

    check_diagnostic_yaml(
        make_record("point", {{"x", integer(1)}, {"label", "origin"}}),
        "!point {label: origin, x: 1}");
}

TEST_CASE("diagnostic YAML summaries", "[encodings][yaml]")
{
    // The summaries contain ": ", so they're quoted.
    check_diagnostic_yaml(
        dynamic_array(100, dynamic(integer(0))), "\"<array - size: 100>\"");

    dynamic_map large_map;
    for (int i = 0; i != 100; ++i)
        large_map[lexical_cast<string>(i)] = integer(i);
    check_diagnostic_yaml(large_map, "\"<map - size: 100>\"");

    // The limit is adjustable and applies at every level.
    check_diagnostic_yaml(
        dynamic({integer(1), integer(2), integer(3)}),
        "\"<array - size: 3>\"",
        2);
    check_diagnostic_yaml(
        dynamic({{"list", dynamic({integer(1), integer(2), integer(3)})}}),
        "list: \"<array - size: 3>\"",
        2);
}

TEST_CASE("dynamic values stream as diagnostic YAML", "[encodings][yaml]")
{
    auto value = dynamic({{"id", integer(3)}, {"tags", dynamic({"a", "b"})}});
    std::ostringstream stream;
    stream << value;
    REQUIRE(stream.str() == value_to_diagnostic_yaml(value));
}
