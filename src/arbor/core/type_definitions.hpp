#ifndef ARBOR_CORE_TYPE_DEFINITIONS_HPP
#define ARBOR_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/optional.hpp>

namespace arbor {

using std::string;

using boost::none;
using boost::optional;

// some(x) wraps :x in an optional of its own (decayed) type.
template<class T>
optional<std::decay_t<T>>
some(T&& x)
{
    return optional<std::decay_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

using boost::posix_time::ptime;

// nil_t is the type of the empty value, :nil.
struct nil_t
{
};
static nil_t nil;

inline bool
operator==(nil_t, nil_t)
{
    return true;
}
inline bool
operator!=(nil_t, nil_t)
{
    return false;
}

struct dynamic;
struct dynamic_record;

// the alternatives that a dynamic value can hold
enum class value_type
{
    NIL, // nil_t
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    DATETIME, // ptime, always UTC
    RECORD, // dynamic_record
    ARRAY, // dynamic_array
    MAP, // dynamic_map
};

// An array is an ordered sequence of values.
typedef std::vector<dynamic> dynamic_array;

// A map associates string keys with values.
// Since it's a std::map, its keys are unique and iterate in sorted order,
// which is the order that comparisons visit them in.
typedef std::map<string, dynamic> dynamic_map;

// dynamic is a value tree whose shape is only known at run time. It's what
// the comparison engine operates on.
//
// A dynamic holds exactly one of the alternatives listed in value_type. The
// value itself lives in a std::any, and type() says which alternative it is.
struct dynamic
{
    dynamic() : type_(value_type::NIL), value_(nil_t())
    {
    }

    dynamic(nil_t) : type_(value_type::NIL), value_(nil_t())
    {
    }
    dynamic(bool v) : type_(value_type::BOOLEAN), value_(v)
    {
    }
    dynamic(integer v) : type_(value_type::INTEGER), value_(v)
    {
    }
    // Without this, a plain int literal would be ambiguous.
    dynamic(int v) : type_(value_type::INTEGER), value_(integer(v))
    {
    }
    dynamic(double v) : type_(value_type::FLOAT), value_(v)
    {
    }
    dynamic(string v) : type_(value_type::STRING), value_(std::move(v))
    {
    }
    dynamic(char const* v) : type_(value_type::STRING), value_(string(v))
    {
    }
    dynamic(ptime const& v) : type_(value_type::DATETIME), value_(v)
    {
    }
    dynamic(dynamic_record v);
    dynamic(dynamic_array v) : type_(value_type::ARRAY), value_(std::move(v))
    {
    }
    dynamic(dynamic_map v) : type_(value_type::MAP), value_(std::move(v))
    {
    }

    // {a, b, c} is an array, but {{"x", a}, {"y", b}} (a list made up
    // entirely of key/value pairs) is a map.
    dynamic(std::initializer_list<dynamic> items);

    value_type
    type() const
    {
        return type_;
    }

    // raw access to the stored value - cast<T>(v) is the checked way to get
    // at it
    std::any const&
    contents() const&
    {
        return value_;
    }
    std::any&
    contents() &
    {
        return value_;
    }
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

    friend void
    swap(dynamic& a, dynamic& b) noexcept
    {
        using std::swap;
        swap(a.type_, b.type_);
        swap(a.value_, b.value_);
    }

 private:
    value_type type_;
    std::any value_;
};

// A record is a map of fields labeled with the name of its type (its tag).
// Records with different tags are never considered equal.
struct dynamic_record
{
    string tag;
    dynamic_map fields;
};

inline dynamic::dynamic(dynamic_record v)
    : type_(value_type::RECORD), value_(std::move(v))
{
}

} // namespace arbor

#endif
