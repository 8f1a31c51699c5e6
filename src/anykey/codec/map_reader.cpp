#include <anykey/codec/map_reader.hpp>

#include <anykey/encodings/json_internals.hpp>

namespace anykey {

struct json_object_reader::impl
{
    simdjson::dom::parser parser;
    simdjson::dom::object object;
    simdjson::dom::object::iterator position;
};

static value_type
json_element_value_type(simdjson::dom::element const& element)
{
    switch (element.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default:
            return value_type::NIL;
        case simdjson::dom::element_type::BOOL:
            return value_type::BOOLEAN;
        case simdjson::dom::element_type::INT64:
        case simdjson::dom::element_type::UINT64:
            return value_type::INTEGER;
        case simdjson::dom::element_type::DOUBLE:
            return value_type::FLOAT;
        case simdjson::dom::element_type::STRING:
            return value_type::STRING;
        case simdjson::dom::element_type::ARRAY:
            return value_type::ARRAY;
        case simdjson::dom::element_type::OBJECT:
            return value_type::MAP;
    }
}

json_object_reader::json_object_reader(std::string_view json)
    : impl_(new impl)
{
    invoke_transcoding_stage(transcoding_stage::OBJECT_PARSING, nullptr, [&] {
        auto document
            = parse_json_document(impl_->parser, json.data(), json.size());
        if (document.type() != simdjson::dom::element_type::OBJECT)
        {
            ANYKEY_THROW(
                json_object_expected()
                << actual_value_type_info(json_element_value_type(document))
                << parsed_text_info(string(json)));
        }
        impl_->object = simdjson::dom::object(document);
        impl_->position = impl_->object.begin();
    });
}

json_object_reader::~json_object_reader()
{
}

size_t
json_object_reader::size() const
{
    return impl_->object.size();
}

bool
json_object_reader::at_end() const
{
    return impl_->position == impl_->object.end();
}

std::string_view
json_object_reader::field_name() const
{
    return impl_->position.key();
}

dynamic
json_object_reader::field_value() const
{
    return read_json_value(impl_->position.value());
}

void
json_object_reader::advance()
{
    ++impl_->position;
}

} // namespace anykey
