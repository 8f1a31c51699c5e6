#ifndef ANYKEY_CODEC_MAP_WRITER_HPP
#define ANYKEY_CODEC_MAP_WRITER_HPP

#include <ostream>
#include <string_view>

#include <anykey/codec/errors.hpp>
#include <anykey/codec/key_transcoding.hpp>

namespace anykey {

// Output sinks for JSON text. A sink is either a string (which is appended
// to) or a stream.
inline void
append_json_text(string& out, std::string_view text)
{
    out.append(text.data(), text.size());
}
inline void
append_json_text(std::ostream& out, std::string_view text)
{
    out.write(text.data(), std::streamsize(text.size()));
}

// json_object_writer writes a JSON object to :Output one entry at a time.
// Each entry is formatted in a scratch buffer (which is reused across
// entries) and then appended to the output, so nothing proportional to the
// size of the whole map is ever held in memory.
template<class Output>
class json_object_writer
{
 public:
    json_object_writer(Output& out, json_writer_config const& config)
        : out_(out), config_(config), entry_count_(0)
    {
    }

    void
    open()
    {
        append_json_text(out_, "{");
    }

    template<class Key, class Value>
    void
    write_entry(Key const& key, Value const& value)
    {
        buffer_.clear();
        if (entry_count_ != 0)
            buffer_ += ',';
        with_field_name(
            key,
            [&](std::string_view name) {
                invoke_transcoding_stage(
                    transcoding_stage::KEY_ENCODING, &name, [&] {
                        write_json_string(
                            buffer_, name.data(), name.size(), config_);
                    });
                buffer_ += ':';
                invoke_transcoding_stage(
                    transcoding_stage::VALUE_ENCODING, &name, [&] {
                        buffer_ += value_to_json(to_dynamic(value), config_);
                    });
            },
            is_string_key<Key>());
        append_json_text(out_, buffer_);
        ++entry_count_;
    }

    void
    close()
    {
        append_json_text(out_, "}");
    }

    size_t
    entry_count() const
    {
        return entry_count_;
    }

 private:
    template<class Key, class Fn>
    void
    with_field_name(Key const& key, Fn&& fn, std::true_type)
    {
        fn(std::string_view(key));
    }

    template<class Key, class Fn>
    void
    with_field_name(Key const& key, Fn&& fn, std::false_type)
    {
        string name = invoke_transcoding_stage(
            transcoding_stage::KEY_ENCODING, nullptr, [&] {
                return encode_map_key(key, config_);
            });
        fn(std::string_view(name));
    }

    Output& out_;
    json_writer_config const& config_;
    string buffer_;
    size_t entry_count_;
};

// dynamic_object_writer collects entries into a string-keyed dynamic_map,
// using the same field names that json_object_writer would write. This is
// how maps are embedded in larger dynamic values. Entries keep the order they
// were written in, including any that share a field name.
class dynamic_object_writer
{
 public:
    template<class Key, class Value>
    void
    write_entry(Key const& key, Value const& value)
    {
        string name = invoke_transcoding_stage(
            transcoding_stage::KEY_ENCODING, nullptr, [&] {
                return encode_map_key(key);
            });
        std::string_view name_view(name);
        dynamic encoded = invoke_transcoding_stage(
            transcoding_stage::VALUE_ENCODING, &name_view, [&] {
                return to_dynamic(value);
            });
        object_.append(std::move(name), std::move(encoded));
    }

    dynamic_map
    release()
    {
        return std::move(object_);
    }

 private:
    dynamic_map object_;
};

} // namespace anykey

#endif
