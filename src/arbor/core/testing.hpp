#ifndef ARBOR_CORE_TESTING_HPP
#define ARBOR_CORE_TESTING_HPP

#include <utility>

#include <catch2/catch.hpp>

#include <arbor/core/dynamic.hpp>

namespace arbor {

// Check that :x and :y (which must differ) behave as values: copies and
// assignments are equal to their sources, swapping exchanges them, and each
// survives conversion to dynamic and back.
template<class T>
void
test_value_pair(T const& x, T const& y)
{
    REQUIRE(x == x);
    REQUIRE(x != y);

    T a = x;
    T b = y;
    REQUIRE(a == x);
    REQUIRE(b == y);

    a = y;
    REQUIRE(a == y);
    a = x;

    using std::swap;
    swap(a, b);
    REQUIRE(a == y);
    REQUIRE(b == x);

    REQUIRE(from_dynamic<T>(to_dynamic(x)) == x);
    REQUIRE(from_dynamic<T>(to_dynamic(y)) == y);
}

} // namespace arbor

#endif
