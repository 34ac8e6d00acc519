#include <arbor/compare/path.hpp>

#include <arbor/core/testing.hpp>

using namespace arbor;

TEST_CASE("value path formatting", "[compare][path]")
{
    REQUIRE(format_value_path(value_path()) == "");
    REQUIRE(format_value_path({dynamic("a")}) == "a");
    REQUIRE(format_value_path({dynamic(integer(1))}) == "[1]");
    REQUIRE(format_value_path({dynamic("a"), dynamic(integer(0))}) == "a[0]");
    REQUIRE(
        format_value_path(
            {dynamic("a"), dynamic("b"), dynamic(integer(2)), dynamic("c")})
        == "a.b[2].c");
    REQUIRE(
        format_value_path(
            {dynamic(integer(0)), dynamic(integer(3)), dynamic("id")})
        == "[0][3].id");
    REQUIRE(
        format_value_path({dynamic("user"), dynamic("roles"), dynamic(1)})
        == "user.roles[1]");
}

TEST_CASE("invalid path elements", "[compare][path]")
{
    try
    {
        format_value_path({dynamic("a"), dynamic(integer(-1))});
        FAIL("no exception thrown");
    }
    catch (invalid_path_element& e)
    {
        REQUIRE(
            get_required_error_info<path_element_info>(e)
            == dynamic(integer(-1)));
    }

    REQUIRE_THROWS_AS(
        format_value_path({dynamic("a"), dynamic(1.5)}), invalid_path_element);
    REQUIRE_THROWS_AS(
        format_value_path({dynamic(nil)}), invalid_path_element);
}
