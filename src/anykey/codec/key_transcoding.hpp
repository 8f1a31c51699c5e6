#ifndef ANYKEY_CODEC_KEY_TRANSCODING_HPP
#define ANYKEY_CODEC_KEY_TRANSCODING_HPP

#include <string_view>
#include <type_traits>

#include <anykey/encodings/json.hpp>

// KEY TRANSCODING - conversion between map keys and JSON object field names
//
// String keys are used as field names directly. Any other key is written as
// its own compact JSON text, and that text is the field name. (The object
// writer then escapes it like any other field name, so the key's quotes and
// backslashes are escaped a second time in the final output.)

namespace anykey {

// is_string_key<Key>::value is true iff keys of type Key are used as field
// names without encoding.
template<class Key>
struct is_string_key : std::false_type
{
};
template<>
struct is_string_key<string> : std::true_type
{
};
template<>
struct is_string_key<std::string_view> : std::true_type
{
};
template<>
struct is_string_key<char const*> : std::true_type
{
};
template<>
struct is_string_key<char*> : std::true_type
{
};
template<class Key>
struct is_string_key<Key const> : is_string_key<Key>
{
};

namespace detail {

template<class Key>
string
encode_map_key(Key const& key, json_writer_config const&, std::true_type)
{
    return string(key);
}

template<class Key>
string
encode_map_key(
    Key const& key, json_writer_config const& config, std::false_type)
{
    return value_to_json(to_dynamic(key), config);
}

template<class Key>
void
decode_map_key(Key* key, string const& field_name, std::true_type)
{
    *key = field_name;
}

template<class Key>
void
decode_map_key(Key* key, string const& field_name, std::false_type)
{
    from_dynamic(key, parse_json_value(field_name));
}

} // namespace detail

// Get the (unescaped) field name text that represents :key.
template<class Key>
string
encode_map_key(
    Key const& key, json_writer_config const& config = json_writer_config())
{
    return detail::encode_map_key(key, config, is_string_key<Key>());
}

// Recover a key from the (unescaped) field name text that represents it.
template<class Key>
void
decode_map_key(Key* key, string const& field_name)
{
    static_assert(
        !is_string_key<Key>::value || std::is_same<Key, string>::value,
        "string keys must be decoded into std::string");
    detail::decode_map_key(key, field_name, is_string_key<Key>());
}

template<class Key>
Key
decode_map_key(string const& field_name)
{
    Key key;
    decode_map_key(&key, field_name);
    return key;
}

} // namespace anykey

#endif
