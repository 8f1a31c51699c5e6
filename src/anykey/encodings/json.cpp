#include <anykey/encodings/json_internals.hpp>

#include <algorithm>

#include <nlohmann/json.hpp>

namespace anykey {

// CONFIG

std::ostream&
operator<<(std::ostream& s, invalid_utf8_handling x)
{
    switch (x)
    {
        case invalid_utf8_handling::STRICT:
            return s << "strict";
        case invalid_utf8_handling::REPLACE:
            return s << "replace";
        case invalid_utf8_handling::IGNORE:
            return s << "ignore";
    }
    ANYKEY_THROW(
        invalid_enum_value() << enum_id_info("invalid_utf8_handling")
                             << enum_value_info(int(x)));
}

void
to_dynamic(dynamic* v, invalid_utf8_handling x)
{
    *v = lexical_cast<string>(x);
}

void
from_dynamic(invalid_utf8_handling* x, dynamic const& v)
{
    string const& s = cast<string>(v);
    if (s == "strict")
        *x = invalid_utf8_handling::STRICT;
    else if (s == "replace")
        *x = invalid_utf8_handling::REPLACE;
    else if (s == "ignore")
        *x = invalid_utf8_handling::IGNORE;
    else
    {
        ANYKEY_THROW(
            invalid_enum_string() << enum_id_info("invalid_utf8_handling")
                                  << enum_string_info(s));
    }
}

size_t
hash_value(invalid_utf8_handling x)
{
    return invoke_hash(int(x));
}

// READING

// Check if a JSON array is actually an encoded map.
// This is the case if the array contains only key/value pairs.
static bool
array_resembles_map(simdjson::dom::array const& array)
{
    if (array.size() == 0)
        return false;
    for (auto const& element : array)
    {
        if (element.type() != simdjson::dom::element_type::OBJECT)
            return false;
        simdjson::dom::object object = element;
        if (object.size() != 2
            || object.at_key("key").error() == simdjson::NO_SUCH_FIELD
            || object.at_key("value").error() == simdjson::NO_SUCH_FIELD)
        {
            return false;
        }
    }
    return true;
}

dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default:
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return integer(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return checked_numeric_cast<integer>(uint64_t(json));
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING:
            return string(json.get_string().value());
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            if (array_resembles_map(source))
            {
                dynamic_map map;
                map.reserve(source.size());
                for (auto const& i : source)
                {
                    map.append(
                        read_json_value(i["key"]), read_json_value(i["value"]));
                }
                return map;
            }
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
                array.push_back(read_json_value(i));
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object = json;
            dynamic_map map;
            map.reserve(object.size());
            for (auto const& i : object)
                map.append(string(i.key), read_json_value(i.value));
            return map;
        }
    }
}

simdjson::dom::element
parse_json_document(
    simdjson::dom::parser& parser, char const* json, size_t length)
{
    simdjson::dom::element doc;
    auto error = parser.parse(json, length).get(doc);
    if (error)
    {
        ANYKEY_THROW(
            parsing_error()
            << expected_format_info("JSON")
            << parsed_text_info(string(json, json + length))
            << parsing_error_info(simdjson::error_message(error)));
    }
    return doc;
}

dynamic
parse_json_value(char const* json, size_t length)
{
    // Each call gets its own parser, so concurrent parses share nothing.
    simdjson::dom::parser parser;
    auto doc = parse_json_document(parser, json, length);
    try
    {
        return read_json_value(doc);
    }
    catch (boost::exception& e)
    {
        e << expected_format_info("JSON")
          << parsed_text_info(string(json, json + length));
        throw;
    }
}

// WRITING

// nlohmann::json writes the scalars. Objects are written here instead,
// since nlohmann::json can't hold two fields with the same name.

static nlohmann::json::error_handler_t
get_error_handler(json_writer_config const& config)
{
    switch (config.invalid_utf8 ? *config.invalid_utf8
                                : invalid_utf8_handling::STRICT)
    {
        case invalid_utf8_handling::STRICT:
        default:
            return nlohmann::json::error_handler_t::strict;
        case invalid_utf8_handling::REPLACE:
            return nlohmann::json::error_handler_t::replace;
        case invalid_utf8_handling::IGNORE:
            return nlohmann::json::error_handler_t::ignore;
    }
}

static void
write_scalar(
    string& out, nlohmann::json const& json, json_writer_config const& config)
{
    try
    {
        out += json.dump(
            -1,
            ' ',
            config.ensure_ascii && *config.ensure_ascii,
            get_error_handler(config));
    }
    catch (nlohmann::json::exception& e)
    {
        ANYKEY_THROW(
            json_encoding_error() << internal_error_message_info(e.what()));
    }
}

static bool
has_only_string_keys(dynamic_map const& map)
{
    return std::all_of(map.begin(), map.end(), [](auto const& entry) {
        return entry.first.type() == value_type::STRING;
    });
}

static void
write_json_value(
    string& out, dynamic const& v, json_writer_config const& config);

static void
write_map(
    string& out, dynamic_map const& map, json_writer_config const& config)
{
    bool first = true;
    if (has_only_string_keys(map))
    {
        out += '{';
        for (auto const& entry : map)
        {
            if (!first)
                out += ',';
            first = false;
            auto const& name = cast<string>(entry.first);
            write_json_string(out, name.data(), name.size(), config);
            out += ':';
            write_json_value(out, entry.second, config);
        }
        out += '}';
        return;
    }
    out += '[';
    for (auto const& entry : map)
    {
        if (!first)
            out += ',';
        first = false;
        out += "{\"key\":";
        write_json_value(out, entry.first, config);
        out += ",\"value\":";
        write_json_value(out, entry.second, config);
        out += '}';
    }
    out += ']';
}

static void
write_json_value(
    string& out, dynamic const& v, json_writer_config const& config)
{
    switch (v.type())
    {
        case value_type::NIL:
        default:
            out += "null";
            break;
        case value_type::BOOLEAN:
            out += cast<bool>(v) ? "true" : "false";
            break;
        case value_type::INTEGER:
            out += lexical_cast<string>(cast<integer>(v));
            break;
        case value_type::FLOAT:
            write_scalar(out, nlohmann::json(cast<double>(v)), config);
            break;
        case value_type::STRING: {
            auto const& s = cast<string>(v);
            write_json_string(out, s.data(), s.size(), config);
            break;
        }
        case value_type::ARRAY: {
            out += '[';
            bool first = true;
            for (auto const& element : cast<dynamic_array>(v))
            {
                if (!first)
                    out += ',';
                first = false;
                write_json_value(out, element, config);
            }
            out += ']';
            break;
        }
        case value_type::MAP:
            write_map(out, cast<dynamic_map>(v), config);
            break;
    }
}

string
value_to_json(dynamic const& v, json_writer_config const& config)
{
    string out;
    write_json_value(out, v, config);
    return out;
}

void
write_json_string(
    string& out,
    char const* text,
    size_t length,
    json_writer_config const& config)
{
    write_scalar(out, nlohmann::json(string(text, length)), config);
}

} // namespace anykey
