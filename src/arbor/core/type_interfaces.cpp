#include <arbor/core/type_interfaces.hpp>

#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

#include <fmt/format.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/numeric/conversion/cast.hpp>

namespace arbor {

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}
void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

void
to_dynamic(dynamic* v, integer x)
{
    *v = x;
}
void
from_dynamic(integer* x, dynamic const& v)
{
    if (v.type() == value_type::FLOAT)
    {
        double d = cast<double>(v);
        if (std::trunc(d) != d)
        {
            ARBOR_THROW(
                type_mismatch()
                << expected_value_type_info(value_type::INTEGER)
                << actual_value_type_info(value_type::FLOAT));
        }
        *x = boost::numeric_cast<integer>(d);
    }
    else
    {
        *x = cast<integer>(v);
    }
}

void
to_dynamic(dynamic* v, std::size_t x)
{
    *v = boost::numeric_cast<integer>(x);
}
void
from_dynamic(std::size_t* x, dynamic const& v)
{
    *x = boost::numeric_cast<std::size_t>(from_dynamic<integer>(v));
}

void
to_dynamic(dynamic* v, double x)
{
    *v = x;
}
void
from_dynamic(double* x, dynamic const& v)
{
    if (v.type() == value_type::INTEGER)
        *x = static_cast<double>(cast<integer>(v));
    else
        *x = cast<double>(v);
}

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}
void
from_dynamic(string* x, dynamic const& v)
{
    *x = cast<string>(v);
}

// DATETIMES

string
to_value_string(ptime const& t)
{
    if (t.is_special())
        return boost::posix_time::to_simple_string(t);
    auto const date = t.date();
    auto const time = t.time_of_day();
    return fmt::format(
        "{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}Z",
        static_cast<int>(date.year()),
        static_cast<int>(date.month().as_number()),
        static_cast<int>(date.day()),
        time.hours(),
        time.minutes(),
        time.seconds(),
        time.total_microseconds() % 1000000);
}

[[noreturn]] static void
throw_datetime_parsing_error(string const& s)
{
    ARBOR_THROW(
        parsing_error() << expected_format_info("datetime")
                        << parsed_text_info(s));
}

// Parse the digits of a UTC offset (everything after the sign).
// "hh", "hhmm" and "hh:mm" are accepted.
static optional<boost::posix_time::time_duration>
parse_utc_offset(string const& digits)
{
    string hhmm = digits;
    if (hhmm.length() == 5 && hhmm[2] == ':')
        hhmm.erase(2, 1);
    if (hhmm.length() != 2 && hhmm.length() != 4)
        return none;
    for (char c : hhmm)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return none;
    }
    int hours = std::stoi(hhmm.substr(0, 2));
    int minutes = hhmm.length() == 4 ? std::stoi(hhmm.substr(2)) : 0;
    if (hours > 23 || minutes > 59)
        return none;
    return boost::posix_time::time_duration(hours, minutes, 0);
}

// Parse the local part of a datetime ("2017-04-26T01:02:03.456").
static optional<ptime>
parse_local_datetime(string const& s)
{
    std::istringstream is(s);
    is.imbue(std::locale(
        std::locale::classic(),
        new boost::posix_time::time_input_facet("%Y-%m-%dT%H:%M:%s")));
    ptime t;
    try
    {
        is >> t;
    }
    catch (std::out_of_range&)
    {
        // a field that's out of range (e.g., month 13)
        return none;
    }
    if (is.fail() || t.is_special() || is.peek() != std::char_traits<char>::eof())
        return none;
    return t;
}

ptime
parse_ptime(string const& s)
{
    auto const t_position = s.find('T');
    if (t_position == string::npos)
        throw_datetime_parsing_error(s);

    string local;
    boost::posix_time::time_duration offset;
    if (!s.empty() && s.back() == 'Z')
    {
        local = s.substr(0, s.length() - 1);
    }
    else
    {
        auto const sign_position = s.find_last_of("+-");
        if (sign_position == string::npos || sign_position < t_position)
            throw_datetime_parsing_error(s);
        auto parsed_offset = parse_utc_offset(s.substr(sign_position + 1));
        if (!parsed_offset)
            throw_datetime_parsing_error(s);
        offset = s[sign_position] == '+' ? *parsed_offset : -*parsed_offset;
        local = s.substr(0, sign_position);
    }

    auto t = parse_local_datetime(local);
    if (!t)
        throw_datetime_parsing_error(s);
    return *t - offset;
}

void
to_dynamic(dynamic* v, ptime const& x)
{
    *v = x;
}
void
from_dynamic(ptime* x, dynamic const& v)
{
    if (v.type() == value_type::STRING)
        *x = parse_ptime(cast<string>(v));
    else
        *x = cast<ptime>(v);
}

} // namespace arbor
