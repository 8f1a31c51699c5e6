#ifndef ANYKEY_CODEC_EMBEDDING_HPP
#define ANYKEY_CODEC_EMBEDDING_HPP

#include <boost/range/begin.hpp>
#include <boost/range/end.hpp>

#include <anykey/codec/collections.hpp>
#include <anykey/core/records.hpp>

// EMBEDDING - field strategies for maps inside records
//
// By default, a map field with non-string keys is encoded as an array of
// key/value pairs. Declaring the field with one of these strategies encodes it
// as an object instead, with its keys transcoded exactly as map_to_json would
// transcode them:
//
//   ANYKEY_DEFINE_RECORD_INTERFACE(
//       my_record, (name)(scores, anykey::any_key_map))

namespace anykey {

namespace detail {

template<class Collection>
void
write_embedded_map(dynamic* v, Collection const& collection)
{
    dynamic_object_writer writer;
    for (auto const& entry : collection)
        writer.write_entry(std::get<0>(entry), std::get<1>(entry));
    *v = writer.release();
}

template<class Collection>
void
read_embedded_map(Collection* collection, dynamic const& v)
{
    typedef collection_entry_types<Collection> entry_types;
    typedef typename entry_types::key_type entry_key_type;
    typedef typename entry_types::value_type entry_value_type;

    *collection = Collection();
    // An empty object may have come through as an empty array.
    if (v.type() == value_type::ARRAY && cast<dynamic_array>(v).empty())
        return;
    for (auto const& field : cast<dynamic_map>(v))
    {
        string const& name = cast<string>(field.first);
        std::string_view name_view(name);
        std::pair<entry_key_type, entry_value_type> entry;
        try
        {
            invoke_transcoding_stage(
                transcoding_stage::KEY_DECODING, &name_view, [&] {
                    anykey::decode_map_key(&entry.first, name);
                });
            invoke_transcoding_stage(
                transcoding_stage::VALUE_DECODING, &name_view, [&] {
                    from_dynamic(&entry.second, field.second);
                });
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, field.first);
            throw;
        }
        add_collection_entry(
            *collection,
            std::move(entry),
            is_associative_collection<Collection>());
    }
}

} // namespace detail

// any_key_map encodes an associative container field as a JSON object.
struct any_key_map
{
    template<class Map>
    static void
    to_dynamic(dynamic* v, Map const& map)
    {
        detail::write_embedded_map(v, map);
    }

    template<class Map>
    static void
    from_dynamic(Map* map, dynamic const& v)
    {
        detail::read_embedded_map(map, v);
    }

    template<class Map>
    static void
    write(dynamic_map& record, string const& field_name, Map const& map)
    {
        to_dynamic(&record[dynamic(field_name)], map);
    }

    template<class Map>
    static void
    read(Map* map, dynamic_map const& record, string const& field_name)
    {
        try
        {
            from_dynamic(map, get_field(record, field_name));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, field_name);
            throw;
        }
    }
};

// any_key_vec encodes a sequence of pairs (e.g., a std::vector of
// std::pair) as a JSON object. The entries are written and read back in
// sequence order, and entries with the same key are all kept.
struct any_key_vec
{
    template<class Vector>
    static void
    to_dynamic(dynamic* v, Vector const& vec)
    {
        detail::write_embedded_map(v, vec);
    }

    template<class Vector>
    static void
    from_dynamic(Vector* vec, dynamic const& v)
    {
        detail::read_embedded_map(vec, v);
    }

    template<class Vector>
    static void
    write(dynamic_map& record, string const& field_name, Vector const& vec)
    {
        to_dynamic(&record[dynamic(field_name)], vec);
    }

    template<class Vector>
    static void
    read(Vector* vec, dynamic_map const& record, string const& field_name)
    {
        try
        {
            from_dynamic(vec, get_field(record, field_name));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, field_name);
            throw;
        }
    }
};

} // namespace anykey

#endif
