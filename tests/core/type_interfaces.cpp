#include <arbor/core/type_interfaces.hpp>

#include <boost/numeric/conversion/cast.hpp>

#include <arbor/core/testing.hpp>

using namespace arbor;

using boost::gregorian::date;

TEST_CASE("scalar conversions", "[core][types]")
{
    test_value_pair(false, true);
    test_value_pair(integer(-2), integer(9));
    test_value_pair(0.5, 1.5);
    test_value_pair(string("ann"), string("bob"));
    test_value_pair(size_t(0), size_t(1024));

    REQUIRE(to_dynamic(size_t(16)) == dynamic(integer(16)));
}

TEST_CASE("numeric conversions", "[core][types]")
{
    // Integral floats can be read as integers, and integers as floats.
    REQUIRE(from_dynamic<integer>(dynamic(3.)) == 3);
    REQUIRE(from_dynamic<size_t>(dynamic(8.)) == 8);
    REQUIRE(from_dynamic<double>(dynamic(integer(3))) == 3.);

    REQUIRE_THROWS_AS(from_dynamic<integer>(dynamic(2.5)), type_mismatch);
    REQUIRE_THROWS_AS(
        from_dynamic<size_t>(dynamic(integer(-1))),
        boost::numeric::bad_numeric_cast);
    REQUIRE_THROWS_AS(from_dynamic<integer>(dynamic("3")), type_mismatch);
    REQUIRE_THROWS_AS(from_dynamic<bool>(dynamic(integer(1))), type_mismatch);
}

TEST_CASE("datetime conversions", "[core][types]")
{
    auto t = ptime(
        date(2017, boost::gregorian::May, 26),
        boost::posix_time::time_duration(13, 2, 3)
            + boost::posix_time::microseconds(456789));
    test_value_pair(t, t + boost::posix_time::seconds(1));

    REQUIRE(to_value_string(t) == "2017-05-26T13:02:03.456789Z");
    REQUIRE(
        to_value_string(ptime(date(2001, boost::gregorian::Feb, 3)))
        == "2001-02-03T00:00:00.000000Z");
    REQUIRE(parse_ptime(to_value_string(t)) == t);

    // Datetimes can be read from strings.
    REQUIRE(from_dynamic<ptime>(dynamic("2017-05-26T13:02:03.456789Z")) == t);
    REQUIRE_THROWS_AS(from_dynamic<ptime>(dynamic(integer(0))), type_mismatch);
}

TEST_CASE("datetime parsing", "[core][types]")
{
    auto noon = ptime(
        date(2020, boost::gregorian::Jan, 2),
        boost::posix_time::time_duration(12, 0, 0));

    REQUIRE(parse_ptime("2020-01-02T12:00:00Z") == noon);
    REQUIRE(parse_ptime("2020-01-02T12:00:00.000Z") == noon);

    // Offsets are normalized to UTC.
    REQUIRE(parse_ptime("2020-01-02T14:00:00+02:00") == noon);
    REQUIRE(parse_ptime("2020-01-02T14:30:00+0230") == noon);
    REQUIRE(parse_ptime("2020-01-02T07:00:00-05") == noon);
    REQUIRE(
        parse_ptime("2020-01-02T00:30:00+01:00")
        == noon - boost::posix_time::hours(12)
               - boost::posix_time::minutes(30));

    for (auto const& text :
         {"asdf",
          "2020-01-02",
          "2020-01-02T12:00:00",
          "2020-01-02T12:00:00ZZ",
          "2020-01-02T12:00:00+2",
          "2020-01-02T12:00:00+25:00",
          "2020-01-02T12:00:00+02:0x",
          "2020-13-02T12:00:00Z"})
    {
        CAPTURE(text);
        try
        {
            parse_ptime(text);
            FAIL("no exception thrown");
        }
        catch (parsing_error& e)
        {
            REQUIRE(
                get_required_error_info<expected_format_info>(e)
                == "datetime");
            REQUIRE(get_required_error_info<parsed_text_info>(e) == text);
        }
    }
}
