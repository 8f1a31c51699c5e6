#ifndef ANYKEY_ENCODINGS_JSON_INTERNALS_HPP
#define ANYKEY_ENCODINGS_JSON_INTERNALS_HPP

// This exposes the simdjson side of the JSON encoding so that other readers
// (e.g., the streaming map reader) can decode individual elements of a
// document they've parsed themselves.
//
// Note that this includes simdjson.h, so only include it from source files.

#include <simdjson.h>

#include <anykey/encodings/json.hpp>

namespace anykey {

// Read a parsed JSON element into a dynamic value.
dynamic
read_json_value(simdjson::dom::element const& json);

// Parse :json with :parser, throwing a parsing_error if it's malformed.
// The returned element refers to memory owned by :parser.
simdjson::dom::element
parse_json_document(
    simdjson::dom::parser& parser, char const* json, size_t length);

} // namespace anykey

#endif
