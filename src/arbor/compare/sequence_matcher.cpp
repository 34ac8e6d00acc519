#include <arbor/compare/sequence_matcher.hpp>

namespace arbor {

dynamic const*
get_id_field(dynamic const& v)
{
    if (v.type() == value_type::MAP)
        return find_field(cast<dynamic_map>(v), "id");
    if (v.type() == value_type::RECORD)
        return find_field(cast<dynamic_record>(v).fields, "id");
    return nullptr;
}

// Find the first item of :b that hasn't been consumed and satisfies :test.
template<class Test>
static optional<size_t>
find_remaining_item(
    dynamic_array const& b, std::vector<bool> const& consumed, Test&& test)
{
    size_t b_size = b.size();
    for (size_t i = 0; i != b_size; ++i)
    {
        if (!consumed[i] && test(b[i]))
            return i;
    }
    return none;
}

sequence_matching
match_sequences(
    dynamic_array const& a,
    dynamic_array const& b,
    item_equivalence const& equivalent,
    sequence_matching_flags const& flags)
{
    sequence_matching matching;
    std::vector<bool> consumed(b.size(), false);

    size_t a_size = a.size();
    for (size_t i = 0; i != a_size; ++i)
    {
        auto const& item = a[i];

        auto partner = find_remaining_item(
            b, consumed, [&](dynamic const& candidate) {
                return equivalent(item, candidate);
            });
        if (partner)
        {
            consumed[*partner] = true;
            matching.matched.push_back(matched_items{i, *partner, true});
            continue;
        }

        if (flags.match_ids)
        {
            dynamic const* id = get_id_field(item);
            if (id)
            {
                partner = find_remaining_item(
                    b, consumed, [&](dynamic const& candidate) {
                        dynamic const* candidate_id = get_id_field(candidate);
                        return candidate_id && equivalent(*id, *candidate_id);
                    });
                if (partner)
                {
                    consumed[*partner] = true;
                    matching.matched.push_back(
                        matched_items{i, *partner, false});
                    continue;
                }
            }
        }

        matching.unmatched_a.push_back(i);
        if (flags.stop_at_first_miss)
            break;
    }

    size_t b_size = b.size();
    for (size_t i = 0; i != b_size; ++i)
    {
        if (!consumed[i])
            matching.unmatched_b.push_back(i);
    }

    return matching;
}

} // namespace arbor
