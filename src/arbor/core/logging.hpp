#ifndef ARBOR_CORE_LOGGING_HPP
#define ARBOR_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <arbor/core/dynamic.hpp>

namespace arbor {

// Get the "arbor" logger.
// If the application hasn't registered a logger under that name, a colored
// stdout logger is created and registered the first time this is called.
std::shared_ptr<spdlog::logger>
get_logger();

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Log a function call (at debug level).
// The arguments are only formatted if debug logging is enabled.
#define ARBOR_LOG_CALL(args)                                                  \
    {                                                                         \
        auto logger = arbor::get_logger();                                    \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define ARBOR_LOG_ARG(arg)                                                    \
    arbor::detail::arg_logger<                                                \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace arbor

#endif
