#ifndef ARBOR_COMPARE_SEQUENCE_MATCHER_HPP
#define ARBOR_COMPARE_SEQUENCE_MATCHER_HPP

#include <vector>

#include <arbor/core/dynamic.hpp>
#include <arbor/core/utilities.hpp>

namespace arbor {

// A pairing of an item in the first array with an item in the second.
struct matched_items
{
    size_t a_index;
    size_t b_index;
    // Were the items judged equivalent? (If not, they were paired because
    // they share the same 'id'.)
    bool equivalent;
};

// sequence_matching describes how the items of two arrays were paired up.
struct sequence_matching
{
    // the pairs that were formed, in the order they were formed
    std::vector<matched_items> matched;
    // indices of items in the first array that found no partner
    std::vector<size_t> unmatched_a;
    // indices of items in the second array that were never paired
    std::vector<size_t> unmatched_b;
};

typedef function_view<bool(dynamic const&, dynamic const&)> item_equivalence;

struct sequence_matching_flags
{
    // If an item has no equivalent partner, pair it with the first remaining
    // item that has an equal 'id' field. (This only applies when both items
    // are maps or records.)
    bool match_ids = false;
    // Stop as soon as an item in the first array fails to find a partner.
    // That item is then the last entry in unmatched_a and the items after
    // it aren't considered at all.
    bool stop_at_first_miss = false;
};

// Pair up the items of :a and :b without regard to order.
// Each item of :a (in order) takes the first remaining item of :b that
// :equivalent accepts. This is greedy, so it won't necessarily find the
// pairing with the fewest leftovers.
sequence_matching
match_sequences(
    dynamic_array const& a,
    dynamic_array const& b,
    item_equivalence const& equivalent,
    sequence_matching_flags const& flags = sequence_matching_flags());

// If :v is a map or record with an 'id' field, this returns a pointer to
// that field's value. Otherwise, it returns nullptr.
dynamic const*
get_id_field(dynamic const& v);

} // namespace arbor

#endif
