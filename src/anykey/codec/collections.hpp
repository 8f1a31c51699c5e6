#ifndef ANYKEY_CODEC_COLLECTIONS_HPP
#define ANYKEY_CODEC_COLLECTIONS_HPP

#include <map>
#include <tuple>
#include <type_traits>
#include <vector>

#include <boost/range/begin.hpp>
#include <boost/range/end.hpp>

#include <anykey/codec/map_codec.hpp>

// COLLECTIONS - entry points for whole containers
//
// All of these route to write_json_map or json_to_iter. They don't reorder,
// deduplicate or buffer entries.

namespace anykey {

// Write a range of pairs as a JSON object.
template<class Iterator>
string
iter_to_json(
    Iterator first,
    Iterator last,
    json_writer_config const& config = json_writer_config())
{
    string json;
    write_json_map(json, first, last, config);
    return json;
}

// Write an associative container (std::map, std::unordered_map, etc.) as a
// JSON object. Entries are written in the container's iteration order.
template<class Map>
string
map_to_json(
    Map const& map, json_writer_config const& config = json_writer_config())
{
    return iter_to_json(boost::begin(map), boost::end(map), config);
}

// Write a sequence of pairs (e.g., a std::vector of std::pair or std::tuple)
// as a JSON object. Entries are written in sequence order, including any
// entries with duplicate keys.
template<class Vector>
string
vec_to_json(
    Vector const& vec, json_writer_config const& config = json_writer_config())
{
    return iter_to_json(boost::begin(vec), boost::end(vec), config);
}

namespace detail {

// the key and value types of a collection whose elements are pair-like
template<class Collection>
struct collection_entry_types
{
    typedef typename Collection::value_type element_type;
    typedef std::remove_const_t<std::tuple_element_t<0, element_type>>
        key_type;
    typedef std::remove_const_t<std::tuple_element_t<1, element_type>>
        value_type;
};

template<class Collection, class = void>
struct is_associative_collection : std::false_type
{
};
template<class Collection>
struct is_associative_collection<
    Collection,
    std::void_t<typename Collection::mapped_type>> : std::true_type
{
};

// Associative collections are assigned to, so a later entry with the same key
// replaces an earlier one.
template<class Collection, class Key, class Value>
void
add_collection_entry(
    Collection& collection, std::pair<Key, Value>&& entry, std::true_type)
{
    collection.insert_or_assign(
        std::move(entry.first), std::move(entry.second));
}

// Sequences receive every entry in document order.
template<class Collection, class Key, class Value>
void
add_collection_entry(
    Collection& collection, std::pair<Key, Value>&& entry, std::false_type)
{
    collection.emplace_back(std::move(entry.first), std::move(entry.second));
}

} // namespace detail

// Read a JSON object into any collection that can be built from pairs.
// The whole operation fails if any entry fails to decode.
template<class Collection>
Collection
json_to_collection(std::string_view json)
{
    typedef detail::collection_entry_types<Collection> entry_types;
    auto entries = json_to_iter<
        typename entry_types::key_type,
        typename entry_types::value_type>(json);
    Collection collection;
    for (auto i = entries.begin(); i != entries.end(); ++i)
    {
        detail::add_collection_entry(
            collection,
            i.take(),
            detail::is_associative_collection<Collection>());
    }
    return collection;
}

// Read a JSON object into an associative container.
template<class Key, class Value, class Map = std::map<Key, Value>>
Map
json_to_map(std::string_view json)
{
    return json_to_collection<Map>(json);
}

// Read a JSON object into a vector of pairs, in document order.
template<class Key, class Value>
std::vector<std::pair<Key, Value>>
json_to_vec(std::string_view json)
{
    return json_to_collection<std::vector<std::pair<Key, Value>>>(json);
}

} // namespace anykey

#endif
