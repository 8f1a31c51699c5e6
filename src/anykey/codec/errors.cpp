#include <anykey/codec/errors.hpp>

namespace anykey {

std::ostream&
operator<<(std::ostream& s, transcoding_stage stage)
{
    switch (stage)
    {
        case transcoding_stage::KEY_ENCODING:
            return s << "key encoding";
        case transcoding_stage::VALUE_ENCODING:
            return s << "value encoding";
        case transcoding_stage::OBJECT_PARSING:
            return s << "object parsing";
        case transcoding_stage::KEY_DECODING:
            return s << "key decoding";
        case transcoding_stage::VALUE_DECODING:
            return s << "value decoding";
    }
    ANYKEY_THROW(
        invalid_enum_value() << enum_id_info("transcoding_stage")
                             << enum_value_info(int(stage)));
}

} // namespace anykey
