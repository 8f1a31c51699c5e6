#ifndef ANYKEY_TESTING_HPP
#define ANYKEY_TESTING_HPP

#include <boost/concept_check.hpp>
#include <boost/optional/optional_io.hpp>

#include <catch2/catch.hpp>

#include <anykey/codec/key_transcoding.hpp>

namespace anykey {

// A type can be used as a map key or value if it's a regular value type that
// converts to and from dynamic.
template<class T>
struct EntryType : boost::DefaultConstructible<T>,
                   boost::Assignable<T>,
                   boost::CopyConstructible<T>,
                   boost::EqualityComparable<T>
{
    BOOST_CONCEPT_USAGE(EntryType)
    {
        using std::swap;
        swap(t, t);

        dynamic v;
        to_dynamic(&v, t);
        from_dynamic(&t, v);
    }

 private:
    T t;
};

// Keys of sorted maps must also be ordered.
template<class T>
struct OrderedEntryType : EntryType<T>, boost::LessThanComparable<T>
{
};

// Check that :x survives copying, assignment, swapping, a trip through JSON
// and a trip through a map key.
template<class T>
void
test_regular_value(T const& x)
{
    BOOST_CONCEPT_ASSERT((EntryType<T>) );

    {
        INFO("copy construction")
        T y = x;
        REQUIRE(y == x);
    }

    {
        INFO("assignment")
        T y;
        y = x;
        REQUIRE(y == x);
    }

    {
        INFO("swapping with a default value")
        T const default_value = T();
        T y = x;
        T z = default_value;
        using std::swap;
        swap(y, z);
        REQUIRE(z == x);
        REQUIRE(y == default_value);
    }

    {
        INFO("JSON round trip")
        auto json = value_to_json(to_dynamic(x));
        INFO(json)
        REQUIRE(from_dynamic<T>(parse_json_value(json)) == x);
    }

    {
        INFO("map key round trip")
        auto field_name = encode_map_key(x);
        INFO(field_name)
        REQUIRE(decode_map_key<T>(field_name) == x);
    }
}

// Check two distinct values (:x < :y) individually and against each other.
template<class T>
void
test_regular_value_pair(T const& x, T const& y)
{
    BOOST_CONCEPT_ASSERT((OrderedEntryType<T>) );

    test_regular_value(x);
    test_regular_value(y);

    REQUIRE(x != y);
    REQUIRE(x < y);
    REQUIRE(!(y < x));
    REQUIRE(invoke_hash(x) != invoke_hash(y));

    T a = x;
    T b = y;
    using std::swap;
    swap(a, b);
    REQUIRE(a == y);
    REQUIRE(b == x);
}

} // namespace anykey

#endif
