#ifndef ARBOR_CORE_EXCEPTION_HPP
#define ARBOR_CORE_EXCEPTION_HPP

#include <string>
#include <typeinfo>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace arbor {

// ERRORS - arbor reports misuse (bad casts, malformed paths, invalid options,
// runaway nesting) through Boost.Exception types. Divergences between the
// values being compared are never reported this way.

// Every exception that arbor throws derives from arbor::error, so a caller
// that only cares whether a comparison could be carried out can catch that.
struct error : virtual boost::exception, virtual std::exception
{
    char const*
    what() const noexcept override
    {
        return boost::diagnostic_information_what(*this);
    }
};

#define ARBOR_DEFINE_EXCEPTION(id)                                            \
    struct id : arbor::error                                                  \
    {                                                                         \
    };

// Error details travel with the exception as boost::error_info values.
// ARBOR_DEFINE_ERROR_INFO(T, id) declares id_info, which carries a T.
#define ARBOR_DEFINE_ERROR_INFO(T, id)                                        \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

ARBOR_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

// Throw :x with the current stack trace attached.
#define ARBOR_THROW(x)                                                        \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << arbor::stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// Thrown by get_required_error_info when the requested info isn't there.
ARBOR_DEFINE_EXCEPTION(missing_error_info)
ARBOR_DEFINE_ERROR_INFO(std::string, error_info_id)

// Get the value of :ErrorInfo that was attached to :e.
// Unlike get_error_info, the info is required, so this returns a reference.
template<class ErrorInfo, class Exception>
typename ErrorInfo::value_type const&
get_required_error_info(Exception const& e)
{
    auto const* info = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        ARBOR_THROW(
            missing_error_info() << error_info_id_info(typeid(ErrorInfo).name()));
    }
    return *info;
}

// GENERAL-PURPOSE ERRORS

// invalid_enum_value is thrown when an enum holds a value outside of its
// declared cases.
ARBOR_DEFINE_EXCEPTION(invalid_enum_value)
ARBOR_DEFINE_ERROR_INFO(std::string, enum_id)
ARBOR_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when a string names none of an enum's cases.
// It also carries enum_id_info.
ARBOR_DEFINE_EXCEPTION(invalid_enum_string)
ARBOR_DEFINE_ERROR_INFO(std::string, enum_string)

// parsing_error is thrown when text (a datetime, options YAML) can't be read.
ARBOR_DEFINE_EXCEPTION(parsing_error)
ARBOR_DEFINE_ERROR_INFO(std::string, expected_format)
ARBOR_DEFINE_ERROR_INFO(std::string, parsed_text)
ARBOR_DEFINE_ERROR_INFO(std::string, parsing_error)

} // namespace arbor

#endif
