#ifndef ANYKEY_CODEC_MAP_CODEC_HPP
#define ANYKEY_CODEC_MAP_CODEC_HPP

#include <tuple>

#include <anykey/codec/map_reader.hpp>
#include <anykey/codec/map_writer.hpp>

// MAP CODEC - transcoding between sequences of key/value pairs and JSON
// objects
//
// Entries are written in iteration order, directly to the output. If an
// entry fails to encode, the exception propagates immediately and whatever
// was already written to the output is left there (and isn't valid JSON).

namespace anykey {

// Write the entries in [first, last) to :out as a JSON object.
// :out is either a string (which is appended to) or a std::ostream.
// Dereferencing an iterator must yield something that std::get<0> and
// std::get<1> can be applied to (e.g., a std::pair or std::tuple, possibly of
// references). It may yield by value.
template<class Output, class Iterator>
void
write_json_map(
    Output& out,
    Iterator first,
    Iterator last,
    json_writer_config const& config = json_writer_config())
{
    json_object_writer<Output> writer(out, config);
    writer.open();
    for (; first != last; ++first)
    {
        auto&& entry = *first;
        writer.write_entry(std::get<0>(entry), std::get<1>(entry));
    }
    writer.close();
}

// Read a JSON object as a lazily decoded range of (Key, Value) pairs.
// The object itself is parsed immediately.
template<class Key, class Value>
json_map_range<Key, Value>
json_to_iter(std::string_view json)
{
    return json_map_range<Key, Value>(json);
}

} // namespace anykey

#endif
