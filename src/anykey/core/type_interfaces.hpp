#ifndef ANYKEY_CORE_TYPE_INTERFACES_HPP
#define ANYKEY_CORE_TYPE_INTERFACES_HPP

#include <array>
#include <map>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include <anykey/core/dynamic.hpp>
#include <anykey/core/utilities.hpp>

// to_dynamic/from_dynamic for the standard types that keys and values are
// usually built from

namespace anykey {

// NIL

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
inline bool
operator<(nil_t, nil_t)
{
    return false;
}

inline void
to_dynamic(dynamic* v, nil_t)
{
    *v = nil;
}
inline void
from_dynamic(nil_t*, dynamic const& v)
{
    check_type(value_type::NIL, v.type());
}

inline size_t
hash_value(nil_t)
{
    return 0;
}

// BOOL AND STRING

void
to_dynamic(dynamic* v, bool x);
void
from_dynamic(bool* x, dynamic const& v);

void
to_dynamic(dynamic* v, string const& x);
void
from_dynamic(string* x, dynamic const& v);

// NUMBERS

// Integers are range-checked in both directions. Floats that hold integral
// values are accepted as integers, and integers are accepted as floats.

#define ANYKEY_DECLARE_NUMBER_INTERFACE(T)                                    \
    void to_dynamic(dynamic* v, T x);                                         \
    void from_dynamic(T* x, dynamic const& v);

ANYKEY_DECLARE_NUMBER_INTERFACE(signed char)
ANYKEY_DECLARE_NUMBER_INTERFACE(unsigned char)
ANYKEY_DECLARE_NUMBER_INTERFACE(signed short)
ANYKEY_DECLARE_NUMBER_INTERFACE(unsigned short)
ANYKEY_DECLARE_NUMBER_INTERFACE(signed int)
ANYKEY_DECLARE_NUMBER_INTERFACE(unsigned int)
ANYKEY_DECLARE_NUMBER_INTERFACE(signed long)
ANYKEY_DECLARE_NUMBER_INTERFACE(unsigned long)
ANYKEY_DECLARE_NUMBER_INTERFACE(signed long long)
ANYKEY_DECLARE_NUMBER_INTERFACE(unsigned long long)
ANYKEY_DECLARE_NUMBER_INTERFACE(float)
ANYKEY_DECLARE_NUMBER_INTERFACE(double)

namespace detail {

// JSON writes empty arrays and empty maps the same way, so when reading a
// container, an empty value of the other kind is accepted as empty.
inline bool
is_empty_container(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::ARRAY:
            return cast<dynamic_array>(v).empty();
        case value_type::MAP:
            return cast<dynamic_map>(v).empty();
        default:
            return false;
    }
}

// Read element :index of :array into :x, recording the index in any error.
template<class Element>
void
read_array_element(Element* x, dynamic_array const& array, size_t index)
{
    try
    {
        from_dynamic(x, array[index]);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, integer(index));
        throw;
    }
}

template<class Map>
void
map_to_dynamic(dynamic* v, Map const& x)
{
    dynamic_map map;
    map.reserve(x.size());
    for (auto const& entry : x)
        map.append(to_dynamic(entry.first), to_dynamic(entry.second));
    *v = std::move(map);
}

// Entries are assigned in order, so if a key appears more than once, the
// last value wins.
template<class Map>
void
map_from_dynamic(Map* x, dynamic const& v)
{
    typedef typename Map::key_type key_type;
    typedef typename Map::mapped_type mapped_type;

    x->clear();
    if (is_empty_container(v))
        return;
    for (auto const& entry : cast<dynamic_map>(v))
    {
        try
        {
            auto key = from_dynamic<key_type>(entry.first);
            x->insert_or_assign(
                std::move(key), from_dynamic<mapped_type>(entry.second));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, entry.first);
            throw;
        }
    }
}

} // namespace detail

// STD::VECTOR

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    array.reserve(x.size());
    for (auto const& element : x)
        array.push_back(to_dynamic(element));
    *v = std::move(array);
}

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    x->clear();
    if (detail::is_empty_container(v))
        return;
    dynamic_array const& array = cast<dynamic_array>(v);
    x->resize(array.size());
    for (size_t i = 0; i != array.size(); ++i)
        detail::read_array_element(&(*x)[i], array, i);
}

// STD::ARRAY

template<class T, size_t N>
void
to_dynamic(dynamic* v, std::array<T, N> const& x)
{
    dynamic_array array;
    array.reserve(N);
    for (auto const& element : x)
        array.push_back(to_dynamic(element));
    *v = std::move(array);
}

template<class T, size_t N>
void
from_dynamic(std::array<T, N>* x, dynamic const& v)
{
    if (N == 0 && detail::is_empty_container(v))
        return;
    dynamic_array const& array = cast<dynamic_array>(v);
    check_array_size(N, array.size());
    for (size_t i = 0; i != N; ++i)
        detail::read_array_element(&(*x)[i], array, i);
}

// STD::PAIR AND STD::TUPLE - fixed-size arrays

template<class First, class Second>
void
to_dynamic(dynamic* v, std::pair<First, Second> const& x)
{
    *v = dynamic_array{to_dynamic(x.first), to_dynamic(x.second)};
}

template<class First, class Second>
void
from_dynamic(std::pair<First, Second>* x, dynamic const& v)
{
    dynamic_array const& array = cast<dynamic_array>(v);
    check_array_size(2, array.size());
    detail::read_array_element(&x->first, array, 0);
    detail::read_array_element(&x->second, array, 1);
}

template<class... Elements>
void
to_dynamic(dynamic* v, std::tuple<Elements...> const& x)
{
    *v = std::apply(
        [](auto const&... elements) {
            return dynamic_array{to_dynamic(elements)...};
        },
        x);
}

namespace detail {

template<class Tuple, size_t... Indices>
void
read_tuple_elements(
    Tuple* x, dynamic_array const& array, std::index_sequence<Indices...>)
{
    (read_array_element(&std::get<Indices>(*x), array, Indices), ...);
}

} // namespace detail

template<class... Elements>
void
from_dynamic(std::tuple<Elements...>* x, dynamic const& v)
{
    dynamic_array const& array = cast<dynamic_array>(v);
    check_array_size(sizeof...(Elements), array.size());
    detail::read_tuple_elements(
        x, array, std::index_sequence_for<Elements...>());
}

// STD::MAP AND STD::UNORDERED_MAP

template<class Key, class Value, class Compare, class Allocator>
void
to_dynamic(dynamic* v, std::map<Key, Value, Compare, Allocator> const& x)
{
    detail::map_to_dynamic(v, x);
}

template<class Key, class Value, class Compare, class Allocator>
void
from_dynamic(std::map<Key, Value, Compare, Allocator>* x, dynamic const& v)
{
    detail::map_from_dynamic(x, v);
}

template<class Key, class Value, class Hash, class Equal, class Allocator>
void
to_dynamic(
    dynamic* v, std::unordered_map<Key, Value, Hash, Equal, Allocator> const& x)
{
    detail::map_to_dynamic(v, x);
}

template<class Key, class Value, class Hash, class Equal, class Allocator>
void
from_dynamic(
    std::unordered_map<Key, Value, Hash, Equal, Allocator>* x,
    dynamic const& v)
{
    detail::map_from_dynamic(x, v);
}

// OPTIONAL - {"some": x} or {"none": null}

ANYKEY_DEFINE_EXCEPTION(invalid_optional_type)
ANYKEY_DEFINE_ERROR_INFO(string, optional_type_tag)

template<class T>
void
to_dynamic(dynamic* v, optional<T> const& x)
{
    if (x)
        *v = dynamic_map{{"some", to_dynamic(*x)}};
    else
        *v = dynamic_map{{"none", nil}};
}

template<class T>
void
from_dynamic(optional<T>* x, dynamic const& v)
{
    dynamic_map const& map = cast<dynamic_map>(v);
    auto const& tag = cast<string>(get_union_tag(map));
    if (tag == "none")
    {
        *x = none;
        return;
    }
    if (tag != "some")
    {
        ANYKEY_THROW(invalid_optional_type() << optional_type_tag_info(tag));
    }
    try
    {
        *x = from_dynamic<T>(get_field(map, "some"));
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, "some");
        throw;
    }
}

} // namespace anykey

namespace boost {

template<class T>
size_t
hash_value(optional<T> const& x)
{
    return x ? anykey::invoke_hash(*x) : 0;
}

} // namespace boost

#endif
