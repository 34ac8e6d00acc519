#include <arbor/encodings/yaml.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

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

// Would a YAML reader take the plain scalar :s for something other than a
// string?
static bool
reads_as_non_string(string const& s)
{
    if (s.empty())
        return true;

    static char const* const keywords[]
        = {"true", "false", "yes", "no", "on", "off", "null", "~"};
    auto const lowered = boost::algorithm::to_lower_copy(s);
    for (auto const* keyword : keywords)
    {
        if (lowered == keyword)
            return true;
    }

    if (boost::algorithm::starts_with(s, "0x")
        || boost::algorithm::starts_with(s, "0o"))
    {
        return true;
    }
    integer i;
    double d;
    if (boost::conversion::try_lexical_convert(s, i)
        || boost::conversion::try_lexical_convert(s, d))
    {
        return true;
    }

    // Datetimes are written as quoted strings, so a string that parses as one
    // is quoted to keep the two distinguishable.
    try
    {
        parse_ptime(s);
        return true;
    }
    catch (parsing_error&)
    {
        return false;
    }
}

namespace {

// diagnostic_emitter writes one dynamic value (and everything inside it) to a
// YAML::Emitter. It's invoked through apply_to_dynamic, so it has a case for
// every alternative.
struct diagnostic_emitter
{
    YAML::Emitter& out;
    size_t max_items;

    void
    operator()(nil_t) const
    {
        out << YAML::Null;
    }

    void
    operator()(bool x) const
    {
        out << x;
    }

    void
    operator()(integer x) const
    {
        out << x;
    }

    void
    operator()(double x) const
    {
        out << x;
    }

    void
    operator()(string const& x) const
    {
        if (reads_as_non_string(x))
            out << YAML::DoubleQuoted;
        out << x;
    }

    void
    operator()(ptime const& x) const
    {
        out << YAML::DoubleQuoted << to_value_string(x);
    }

    void
    operator()(dynamic_record const& x) const
    {
        out << YAML::LocalTag(x.tag) << YAML::Flow;
        (*this)(x.fields);
    }

    void
    operator()(dynamic_array const& x) const
    {
        if (x.size() > max_items)
        {
            out << summary("array", x.size());
            return;
        }
        out << YAML::BeginSeq;
        for (auto const& item : x)
            apply_to_dynamic(*this, item);
        out << YAML::EndSeq;
    }

    void
    operator()(dynamic_map const& x) const
    {
        if (x.size() > max_items)
        {
            out << summary("map", x.size());
            return;
        }
        out << YAML::BeginMap;
        for (auto const& field : x)
        {
            out << YAML::Key << field.first << YAML::Value;
            apply_to_dynamic(*this, field.second);
        }
        out << YAML::EndMap;
    }

    static string
    summary(char const* kind, size_t size)
    {
        return "<" + string(kind)
               + " - size: " + boost::lexical_cast<string>(size) + ">";
    }
};

} // namespace

string
value_to_diagnostic_yaml(dynamic const& v, size_t max_items)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5) << YAML::DoublePrecision(12);
    apply_to_dynamic(diagnostic_emitter{out, max_items}, v);
    return string(out.c_str(), out.size());
}

} // namespace arbor
