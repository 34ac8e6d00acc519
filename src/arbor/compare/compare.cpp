#include <arbor/compare/compare.hpp>

#include <algorithm>
#include <cmath>

#include <boost/algorithm/string/replace.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <arbor/compare/sequence_matcher.hpp>
#include <arbor/core/logging.hpp>
#include <arbor/core/type_interfaces.hpp>
#include <arbor/core/utilities.hpp>

namespace arbor {

namespace {

struct traversal_state
{
    traversal_state(comparison_options const& options) : options(options)
    {
    }

    comparison_options const& options;

    // the path to the values currently being compared
    value_path path;

    // the number of containers we're currently inside of
    size_t depth = 0;
};

// path_extension appends a segment to the traversal path for as long as it
// exists.
struct path_extension
{
    path_extension(value_path& path, dynamic segment) : path_(path)
    {
        path_.push_back(std::move(segment));
    }
    ~path_extension()
    {
        path_.pop_back();
    }

 private:
    value_path& path_;
};

// depth_guard records a descent into a container and checks it against the
// nesting limit.
struct depth_guard
{
    depth_guard(traversal_state& state) : state_(state)
    {
        ++state_.depth;
        if (state_.depth > state_.options.max_depth)
        {
            string path = format_value_path(state_.path);
            get_logger()->warn(
                "comparison exceeded the nesting limit ({}) at '{}'",
                state_.options.max_depth,
                path);
            --state_.depth;
            ARBOR_THROW(
                nesting_too_deep() << depth_limit_info(state_.options.max_depth)
                                   << nesting_path_info(path));
        }
    }
    ~depth_guard()
    {
        --state_.depth;
    }

 private:
    traversal_state& state_;
};

dynamic
index_segment(size_t index)
{
    return dynamic(integer(index));
}

value_divergence
make_divergence(
    traversal_state const& state,
    divergence_kind kind,
    optional<dynamic> expected,
    optional<dynamic> actual)
{
    return make_value_divergence(
        state.path, kind, std::move(expected), std::move(actual));
}

// The shape of a pair of values determines which rule compares them.
// The cases are listed in order of precedence.
enum class pair_shape
{
    DATETIMES,
    RECORDS,
    ONE_RECORD,
    MAPS,
    ARRAYS,
    ONE_ARRAY,
    SCALARS
};

// the part that a single value plays in choosing a rule
enum class value_role
{
    SCALAR,
    DATETIME,
    RECORD,
    MAP,
    ARRAY
};

value_role
role_of(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        case value_type::BOOLEAN:
        case value_type::INTEGER:
        case value_type::FLOAT:
        case value_type::STRING:
            return value_role::SCALAR;
        case value_type::DATETIME:
            return value_role::DATETIME;
        case value_type::RECORD:
            return value_role::RECORD;
        case value_type::MAP:
            return value_role::MAP;
        case value_type::ARRAY:
            return value_role::ARRAY;
    }
    ARBOR_THROW(
        invalid_enum_value() << enum_id_info("value_type")
                             << enum_value_info(static_cast<int>(v.type())));
}

pair_shape
classify_pair(dynamic const& a, dynamic const& b)
{
    auto const a_role = role_of(a);
    auto const b_role = role_of(b);
    if (a_role == value_role::DATETIME && b_role == value_role::DATETIME)
        return pair_shape::DATETIMES;
    if (a_role == value_role::RECORD && b_role == value_role::RECORD)
        return pair_shape::RECORDS;
    if (a_role == value_role::RECORD || b_role == value_role::RECORD)
        return pair_shape::ONE_RECORD;
    if (a_role == value_role::MAP && b_role == value_role::MAP)
        return pair_shape::MAPS;
    if (a_role == value_role::ARRAY && b_role == value_role::ARRAY)
        return pair_shape::ARRAYS;
    if (a_role == value_role::ARRAY || b_role == value_role::ARRAY)
        return pair_shape::ONE_ARRAY;
    // Everything else (including a datetime or map against some other kind
    // of value) is held to scalar equality.
    return pair_shape::SCALARS;
}

void
throw_invalid_shape(pair_shape shape)
{
    ARBOR_THROW(
        invalid_enum_value() << enum_id_info("pair_shape")
                             << enum_value_info(static_cast<int>(shape)));
}

// How a value describes itself when only one side of the pair is a record.
dynamic
record_side(dynamic const& v)
{
    if (v.type() == value_type::RECORD)
        return dynamic(cast<dynamic_record>(v).tag);
    return dynamic("not a record");
}

// How a value describes itself when only one side of the pair is an array.
dynamic
array_side(dynamic const& v)
{
    if (v.type() == value_type::ARRAY)
        return dynamic("array");
    return v;
}

boost::posix_time::ptime
truncate_to_seconds(boost::posix_time::ptime const& t)
{
    if (t.is_special())
        return t;
    auto time_of_day = t.time_of_day();
    return boost::posix_time::ptime(
        t.date(),
        boost::posix_time::time_duration(
            time_of_day.hours(),
            time_of_day.minutes(),
            time_of_day.seconds()));
}

bool
datetimes_match(
    comparison_options const& options,
    boost::posix_time::ptime const& a,
    boost::posix_time::ptime const& b)
{
    if (a.is_not_a_date_time() || b.is_not_a_date_time())
        return a.is_not_a_date_time() && b.is_not_a_date_time();
    if (options.truncate_timestamp_subsecond)
        return truncate_to_seconds(a) == truncate_to_seconds(b);
    return a == b;
}

// Is the float :f exactly equal to the integer :i?
bool
integer_equals_float(integer i, double f)
{
    if (!std::isfinite(f) || std::trunc(f) != f)
        return false;
    // The range of integer is [-2^63, 2^63).
    if (f < -9223372036854775808.0 || f >= 9223372036854775808.0)
        return false;
    return static_cast<integer>(f) == i;
}

// scalar_equality decides the SCALARS case. It's applied to every pairing of
// alternatives, so values of different types fall through to the first
// overload unless a more specific one says otherwise.
struct scalar_equality
{
    template<class X, class Y>
    bool
    operator()(X const&, Y const&) const
    {
        return false;
    }

    template<class T>
    bool
    operator()(T const& x, T const& y) const
    {
        return x == y;
    }

    bool
    operator()(double x, double y) const
    {
        return x == y || (std::isnan(x) && std::isnan(y));
    }

    bool
    operator()(integer i, double f) const
    {
        return integer_equals_float(i, f);
    }

    bool
    operator()(double f, integer i) const
    {
        return integer_equals_float(i, f);
    }
};

bool
scalars_match(dynamic const& a, dynamic const& b)
{
    return apply_to_dynamic(
        [&](auto const& x) {
            return apply_to_dynamic(
                [&](auto const& y) { return scalar_equality()(x, y); }, b);
        },
        a);
}

// FIRST-DIVERGENCE MODE

optional<value_divergence>
find_divergence(traversal_state& state, dynamic const& a, dynamic const& b);

optional<value_divergence>
find_map_divergence(
    traversal_state& state, dynamic_map const& a, dynamic_map const& b)
{
    for (auto const& field : a)
    {
        if (b.find(field.first) == b.end())
        {
            path_extension extension(state.path, dynamic(field.first));
            return make_divergence(
                state, divergence_kind::MISSING_KEY, field.second, none);
        }
    }
    for (auto const& field : b)
    {
        if (a.find(field.first) == a.end())
        {
            path_extension extension(state.path, dynamic(field.first));
            return make_divergence(
                state, divergence_kind::EXTRA_KEY, none, field.second);
        }
    }
    // At this point, the key sets are identical.
    for (auto const& field : a)
    {
        path_extension extension(state.path, dynamic(field.first));
        auto divergence
            = find_divergence(state, field.second, b.at(field.first));
        if (divergence)
            return divergence;
    }
    return none;
}

optional<value_divergence>
find_array_divergence(
    traversal_state& state, dynamic_array const& a, dynamic_array const& b)
{
    if (a.size() != b.size())
    {
        path_extension extension(
            state.path, index_segment((std::min)(a.size(), b.size())));
        return make_divergence(
            state,
            divergence_kind::LIST_LENGTH_MISMATCH,
            to_dynamic(a.size()),
            to_dynamic(b.size()));
    }

    if (state.options.strict_list_order)
    {
        size_t size = a.size();
        for (size_t i = 0; i != size; ++i)
        {
            path_extension extension(state.path, index_segment(i));
            auto divergence = find_divergence(state, a[i], b[i]);
            if (divergence)
                return divergence;
        }
        return none;
    }

    sequence_matching_flags flags;
    flags.stop_at_first_miss = true;
    auto equivalent = [&](dynamic const& x, dynamic const& y) {
        return !find_divergence(state, x, y);
    };
    auto matching = match_sequences(a, b, equivalent, flags);
    // The lengths are equal, so if every item of :a found a partner, every
    // item of :b was consumed.
    if (!matching.unmatched_a.empty())
    {
        return make_divergence(
            state,
            divergence_kind::UNMATCHED_LIST_ITEM,
            a[matching.unmatched_a.back()],
            none);
    }
    return none;
}

optional<value_divergence>
find_divergence(traversal_state& state, dynamic const& a, dynamic const& b)
{
    auto shape = classify_pair(a, b);
    switch (shape)
    {
        case pair_shape::DATETIMES:
            if (datetimes_match(
                    state.options,
                    cast<boost::posix_time::ptime>(a),
                    cast<boost::posix_time::ptime>(b)))
            {
                return none;
            }
            return make_divergence(
                state, divergence_kind::DATETIME_MISMATCH, a, b);
        case pair_shape::RECORDS: {
            auto const& a_record = cast<dynamic_record>(a);
            auto const& b_record = cast<dynamic_record>(b);
            if (a_record.tag != b_record.tag)
            {
                return make_divergence(
                    state,
                    divergence_kind::STRUCT_TYPE_MISMATCH,
                    dynamic(a_record.tag),
                    dynamic(b_record.tag));
            }
            depth_guard guard(state);
            return find_map_divergence(state, a_record.fields, b_record.fields);
        }
        case pair_shape::ONE_RECORD:
            return make_divergence(
                state,
                divergence_kind::TYPE_MISMATCH,
                record_side(a),
                record_side(b));
        case pair_shape::MAPS: {
            depth_guard guard(state);
            return find_map_divergence(
                state, cast<dynamic_map>(a), cast<dynamic_map>(b));
        }
        case pair_shape::ARRAYS: {
            depth_guard guard(state);
            return find_array_divergence(
                state, cast<dynamic_array>(a), cast<dynamic_array>(b));
        }
        case pair_shape::ONE_ARRAY:
            return make_divergence(
                state,
                divergence_kind::TYPE_MISMATCH,
                array_side(a),
                array_side(b));
        case pair_shape::SCALARS:
            if (scalars_match(a, b))
                return none;
            return make_divergence(
                state, divergence_kind::VALUE_MISMATCH, a, b);
    }
    throw_invalid_shape(shape);
    return none;
}

// EXHAUSTIVE MODE

void
collect_all(
    traversal_state& state,
    std::vector<value_divergence>& divergences,
    dynamic const& a,
    dynamic const& b);

void
collect_map_divergences(
    traversal_state& state,
    std::vector<value_divergence>& divergences,
    dynamic_map const& a,
    dynamic_map const& b)
{
    for (auto const& field : a)
    {
        if (b.find(field.first) == b.end())
        {
            path_extension extension(state.path, dynamic(field.first));
            divergences.push_back(make_divergence(
                state, divergence_kind::MISSING_KEY, field.second, none));
        }
    }
    for (auto const& field : b)
    {
        if (a.find(field.first) == a.end())
        {
            path_extension extension(state.path, dynamic(field.first));
            divergences.push_back(make_divergence(
                state, divergence_kind::EXTRA_KEY, none, field.second));
        }
    }
    // Both maps are sorted by key, so the shared keys can be found by walking
    // them together.
    auto a_i = a.begin();
    auto b_i = b.begin();
    while (a_i != a.end() && b_i != b.end())
    {
        if (a_i->first < b_i->first)
        {
            ++a_i;
        }
        else if (b_i->first < a_i->first)
        {
            ++b_i;
        }
        else
        {
            path_extension extension(state.path, dynamic(a_i->first));
            collect_all(state, divergences, a_i->second, b_i->second);
            ++a_i;
            ++b_i;
        }
    }
}

void
collect_array_divergences(
    traversal_state& state,
    std::vector<value_divergence>& divergences,
    dynamic_array const& a,
    dynamic_array const& b)
{
    if (a.size() != b.size())
    {
        divergences.push_back(make_divergence(
            state,
            divergence_kind::LIST_LENGTH_MISMATCH,
            to_dynamic(a.size()),
            to_dynamic(b.size())));
        return;
    }

    if (state.options.strict_list_order)
    {
        size_t size = a.size();
        for (size_t i = 0; i != size; ++i)
        {
            path_extension extension(state.path, index_segment(i));
            collect_all(state, divergences, a[i], b[i]);
        }
        return;
    }

    sequence_matching_flags flags;
    flags.match_ids = true;
    auto equivalent = [&](dynamic const& x, dynamic const& y) {
        return !find_divergence(state, x, y);
    };
    auto matching = match_sequences(a, b, equivalent, flags);

    // Pairs are numbered in the order they were formed, and the leftover
    // items continue that numbering.
    size_t index = 0;
    for (auto const& pair : matching.matched)
    {
        if (!pair.equivalent)
        {
            path_extension extension(state.path, index_segment(index));
            collect_all(state, divergences, a[pair.a_index], b[pair.b_index]);
        }
        ++index;
    }
    for (auto i : matching.unmatched_a)
    {
        path_extension extension(state.path, index_segment(index));
        divergences.push_back(make_divergence(
            state, divergence_kind::UNMATCHED_LIST_ITEM, a[i], none));
        ++index;
    }
    for (auto i : matching.unmatched_b)
    {
        path_extension extension(state.path, index_segment(index));
        divergences.push_back(make_divergence(
            state, divergence_kind::UNMATCHED_LIST_ITEM, none, b[i]));
        ++index;
    }
}

void
collect_all(
    traversal_state& state,
    std::vector<value_divergence>& divergences,
    dynamic const& a,
    dynamic const& b)
{
    auto shape = classify_pair(a, b);
    switch (shape)
    {
        case pair_shape::DATETIMES:
            if (!datetimes_match(
                    state.options,
                    cast<boost::posix_time::ptime>(a),
                    cast<boost::posix_time::ptime>(b)))
            {
                divergences.push_back(make_divergence(
                    state, divergence_kind::DATETIME_MISMATCH, a, b));
            }
            return;
        case pair_shape::RECORDS: {
            auto const& a_record = cast<dynamic_record>(a);
            auto const& b_record = cast<dynamic_record>(b);
            if (a_record.tag != b_record.tag)
            {
                divergences.push_back(make_divergence(
                    state,
                    divergence_kind::STRUCT_TYPE_MISMATCH,
                    dynamic(a_record.tag),
                    dynamic(b_record.tag)));
                return;
            }
            depth_guard guard(state);
            collect_map_divergences(
                state, divergences, a_record.fields, b_record.fields);
            return;
        }
        case pair_shape::ONE_RECORD:
            divergences.push_back(make_divergence(
                state,
                divergence_kind::TYPE_MISMATCH,
                record_side(a),
                record_side(b)));
            return;
        case pair_shape::MAPS: {
            depth_guard guard(state);
            collect_map_divergences(
                state, divergences, cast<dynamic_map>(a), cast<dynamic_map>(b));
            return;
        }
        case pair_shape::ARRAYS: {
            depth_guard guard(state);
            collect_array_divergences(
                state,
                divergences,
                cast<dynamic_array>(a),
                cast<dynamic_array>(b));
            return;
        }
        case pair_shape::ONE_ARRAY:
            divergences.push_back(make_divergence(
                state,
                divergence_kind::TYPE_MISMATCH,
                array_side(a),
                array_side(b)));
            return;
        case pair_shape::SCALARS:
            if (!scalars_match(a, b))
            {
                divergences.push_back(make_divergence(
                    state, divergence_kind::VALUE_MISMATCH, a, b));
            }
            return;
    }
    throw_invalid_shape(shape);
}

} // namespace

optional<value_divergence>
find_first_divergence(
    dynamic const& a, dynamic const& b, comparison_options const& options)
{
    traversal_state state(options);
    return find_divergence(state, a, b);
}

std::vector<value_divergence>
collect_divergences(
    dynamic const& a, dynamic const& b, comparison_options const& options)
{
    traversal_state state(options);
    std::vector<value_divergence> divergences;
    collect_all(state, divergences, a, b);
    return divergences;
}

bool
values_match(
    dynamic const& a, dynamic const& b, comparison_options const& options)
{
    return !find_first_divergence(a, b, options);
}

string
render_error_message(string const& error_template, string const& path)
{
    return boost::algorithm::replace_all_copy(error_template, "%{path}", path);
}

comparison_result
compare(dynamic const& a, dynamic const& b, comparison_options const& options)
{
    ARBOR_LOG_CALL(<< ARBOR_LOG_ARG(options))

    comparison_result result;
    if (options.exhaustive)
    {
        result.divergences = collect_divergences(a, b, options);
    }
    else
    {
        auto divergence = find_first_divergence(a, b, options);
        if (divergence)
        {
            result.message = render_error_message(
                options.error_template, format_value_path(divergence->path));
            result.divergences.push_back(std::move(*divergence));
        }
    }

    get_logger()->debug(
        "comparison finished with {} divergence(s)",
        result.divergences.size());

    return result;
}

} // namespace arbor
