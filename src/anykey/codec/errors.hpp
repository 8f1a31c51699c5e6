#ifndef ANYKEY_CODEC_ERRORS_HPP
#define ANYKEY_CODEC_ERRORS_HPP

#include <ostream>
#include <string_view>

#include <anykey/core/dynamic.hpp>
#include <anykey/core/utilities.hpp>

namespace anykey {

// The stages of transcoding a map to or from JSON. Every error that escapes
// the map codec carries the stage it occurred in.
enum class transcoding_stage
{
    KEY_ENCODING,
    VALUE_ENCODING,
    OBJECT_PARSING,
    KEY_DECODING,
    VALUE_DECODING
};

std::ostream&
operator<<(std::ostream& s, transcoding_stage stage);

ANYKEY_DEFINE_ERROR_INFO(transcoding_stage, transcoding_stage)

// The field name text of the entry that failed to transcode. (For non-string
// keys, this is the key's JSON text, before escaping.)
ANYKEY_DEFINE_ERROR_INFO(string, map_key_text)

// Thrown when the outer JSON text is valid but isn't an object.
// This also carries an actual_value_type_info.
ANYKEY_DEFINE_EXCEPTION(json_object_expected)

// Thrown when a transcoding step fails with an exception that doesn't
// support Boost.Exception annotations. The original message is conveyed in an
// internal_error_message_info.
ANYKEY_DEFINE_EXCEPTION(map_transcoding_failed)

// Invoke :fn, annotating anything it throws with :stage (and :key_text, if
// given) unless it's already annotated. boost::exceptions are rethrown as-is.
// Other std::exceptions are wrapped in map_transcoding_failed.
template<class Fn>
auto
invoke_transcoding_stage(
    transcoding_stage stage, std::string_view const* key_text, Fn&& fn)
    -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (boost::exception& e)
    {
        // Nested transcodings (e.g., of embedded maps) have already recorded
        // the innermost stage.
        if (!get_error_info<transcoding_stage_info>(e))
        {
            e << transcoding_stage_info(stage);
            if (key_text)
                e << map_key_text_info(string(*key_text));
        }
        throw;
    }
    catch (std::exception& e)
    {
        map_transcoding_failed failure;
        failure << transcoding_stage_info(stage)
                << internal_error_message_info(e.what());
        if (key_text)
            failure << map_key_text_info(string(*key_text));
        ANYKEY_THROW(failure);
    }
}

} // namespace anykey

#endif
