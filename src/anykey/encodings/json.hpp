#ifndef ANYKEY_ENCODINGS_JSON_HPP
#define ANYKEY_ENCODINGS_JSON_HPP

#include <ostream>

#include <anykey/core.hpp>

// JSON - conversion to and from JSON strings

namespace anykey {

// What the JSON writer does when it encounters text that isn't valid UTF-8.
enum class invalid_utf8_handling
{
    // Throw a json_encoding_error.
    STRICT,
    // Substitute U+FFFD for each invalid byte sequence.
    REPLACE,
    // Drop invalid byte sequences.
    IGNORE
};

std::ostream&
operator<<(std::ostream& s, invalid_utf8_handling x);

// invalid_utf8_handling is stored as one of the strings "strict", "replace"
// or "ignore".
void
to_dynamic(dynamic* v, invalid_utf8_handling x);
void
from_dynamic(invalid_utf8_handling* x, dynamic const& v);

size_t
hash_value(invalid_utf8_handling x);

struct json_writer_config
{
    // Escape all non-ASCII characters as \uXXXX sequences. (Default: false)
    omissible<bool> ensure_ascii;

    // (Default: STRICT)
    omissible<invalid_utf8_handling> invalid_utf8;
};

ANYKEY_DEFINE_RECORD_INTERFACE(json_writer_config, (ensure_ascii)(invalid_utf8))
ANYKEY_DEFINE_RECORD_EQUALITY(json_writer_config, (ensure_ascii)(invalid_utf8))

// Thrown when a value can't be written as JSON (e.g., because it contains
// invalid UTF-8).
ANYKEY_DEFINE_EXCEPTION(json_encoding_error)

// Thrown when text can't be parsed.
ANYKEY_DEFINE_EXCEPTION(parsing_error)
// the format that the text was supposed to be in
ANYKEY_DEFINE_ERROR_INFO(string, expected_format)
ANYKEY_DEFINE_ERROR_INFO(string, parsed_text)
// the parser's description of what went wrong
ANYKEY_DEFINE_ERROR_INFO(string, parsing_error)

// Parse some JSON text into a dynamic value.
// Object fields are kept in the order they're written, duplicates included.
// Arrays of {"key": ..., "value": ...} objects are read as maps.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
static inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in compact JSON format (no whitespace).
// Maps whose keys are all strings are written as objects, with their entries
// in order (duplicates included). Other maps are written as arrays of
// {"key": ..., "value": ...} objects.
string
value_to_json(
    dynamic const& v, json_writer_config const& config = json_writer_config());

// Append the JSON string literal for :text (including the quotes) to :out.
// The result is exactly what value_to_json would write for the string.
void
write_json_string(
    string& out,
    char const* text,
    size_t length,
    json_writer_config const& config = json_writer_config());

} // namespace anykey

#endif
