#ifndef ARBOR_CORE_DYNAMIC_HPP
#define ARBOR_CORE_DYNAMIC_HPP

#include <iosfwd>

#include <arbor/core/exception.hpp>
#include <arbor/core/type_definitions.hpp>

namespace arbor {

std::ostream&
operator<<(std::ostream& s, value_type t);

// TYPE CHECKING

// Thrown when a dynamic value is used as a type that it doesn't hold.
ARBOR_DEFINE_EXCEPTION(type_mismatch)
ARBOR_DEFINE_ERROR_INFO(value_type, expected_value_type)
ARBOR_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Throw type_mismatch unless :actual is :expected.
void
check_type(value_type expected, value_type actual);

// value_type_of<T>::value is the value_type tag of the alternative T.
template<class T>
struct value_type_of;

#define ARBOR_DECLARE_VALUE_TYPE(T, tag)                                      \
    template<>                                                                \
    struct value_type_of<T>                                                   \
    {                                                                         \
        static constexpr value_type value = value_type::tag;                  \
    };

ARBOR_DECLARE_VALUE_TYPE(nil_t, NIL)
ARBOR_DECLARE_VALUE_TYPE(bool, BOOLEAN)
ARBOR_DECLARE_VALUE_TYPE(integer, INTEGER)
ARBOR_DECLARE_VALUE_TYPE(double, FLOAT)
ARBOR_DECLARE_VALUE_TYPE(string, STRING)
ARBOR_DECLARE_VALUE_TYPE(ptime, DATETIME)
ARBOR_DECLARE_VALUE_TYPE(dynamic_record, RECORD)
ARBOR_DECLARE_VALUE_TYPE(dynamic_array, ARRAY)
ARBOR_DECLARE_VALUE_TYPE(dynamic_map, MAP)

#undef ARBOR_DECLARE_VALUE_TYPE

// Get the alternative of type T held by :v.
// If :v holds some other alternative, this throws type_mismatch.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

// DISPATCH

// Invoke :fn on the alternative held by :v.
// :fn must accept every alternative (nil_t, bool, integer, double, string,
// ptime, dynamic_record, dynamic_array and dynamic_map). The switch names
// every value_type, so adding an alternative without handling it here is
// caught by the compiler.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
            return fn(cast<nil_t>(v));
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::INTEGER:
            return fn(cast<integer>(v));
        case value_type::FLOAT:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::DATETIME:
            return fn(cast<ptime>(v));
        case value_type::RECORD:
            return fn(cast<dynamic_record>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::MAP:
            return fn(cast<dynamic_map>(v));
    }
    ARBOR_THROW(
        invalid_enum_value() << enum_id_info("value_type")
                             << enum_value_info(static_cast<int>(v.type())));
}

// Invoke :fn on the alternatives held by :a and :b, which must be the same
// (or this throws type_mismatch).
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    return apply_to_dynamic(
        [&](auto const& x) {
            using alternative = std::decay_t<decltype(x)>;
            return fn(x, cast<alternative>(b));
        },
        a);
}

// EQUALITY

// These are exact, structural equality: the alternatives must match and so
// must their contents. (1 and 1.0 are not equal here. The comparison engine
// applies its own, looser rules.)

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

bool
operator==(dynamic_record const& a, dynamic_record const& b);
bool
operator!=(dynamic_record const& a, dynamic_record const& b);

// Values are streamed as diagnostic YAML.
std::ostream&
operator<<(std::ostream& s, dynamic const& v);

// FIELDS

// Look up :key in :map. Returns nullptr if it's not there.
dynamic const*
find_field(dynamic_map const& map, string const& key);

// Same, but the field is required.
dynamic const&
get_field(dynamic_map const& map, string const& key);

ARBOR_DEFINE_EXCEPTION(missing_field)
ARBOR_DEFINE_ERROR_INFO(string, field_name)

// Make a record value.
dynamic
make_record(string tag, dynamic_map fields);

// CONVERSIONS

// Types that take part in arbor's dynamic interface provide
// to_dynamic(&v, x) and from_dynamic(&x, v). These are the value-returning
// forms.

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// Read :key from :map into :x if it's present. Otherwise, leave :x alone.
template<class T>
void
read_optional_field(T* x, dynamic_map const& map, string const& key)
{
    if (auto const* field = find_field(map, key))
        from_dynamic(x, *field);
}

} // namespace arbor

#endif
