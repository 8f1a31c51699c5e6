#ifndef ANYKEY_CODEC_MAP_READER_HPP
#define ANYKEY_CODEC_MAP_READER_HPP

#include <iterator>
#include <memory>
#include <string_view>
#include <utility>

#include <anykey/codec/errors.hpp>
#include <anykey/codec/key_transcoding.hpp>

namespace anykey {

// json_object_reader parses a JSON object up front and then steps through its
// fields in document order. Field values are decoded only when requested.
//
// If the text isn't valid JSON, the constructor throws a parsing_error. If
// it's valid JSON but not an object, it throws json_object_expected. Either
// way, the error is tagged with transcoding_stage::OBJECT_PARSING.
class json_object_reader
{
 public:
    explicit json_object_reader(std::string_view json);
    ~json_object_reader();

    json_object_reader(json_object_reader const&) = delete;
    json_object_reader&
    operator=(json_object_reader const&) = delete;

    // the number of fields in the object
    size_t
    size() const;

    bool
    at_end() const;

    // The following are only valid when !at_end().

    // the (unescaped) name of the current field
    std::string_view
    field_name() const;

    // the value of the current field
    dynamic
    field_value() const;

    void
    advance();

 private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

// json_map_range<Key, Value> is a single-pass input range over the entries of
// a JSON object, decoded as pairs of Key and Value. Each entry is decoded when
// an iterator reaches it, so a malformed entry causes an exception at that
// point in the iteration (tagged with KEY_DECODING or VALUE_DECODING and the
// entry's map_key_text_info).
//
// Copies of a range share the same underlying reader.
template<class Key, class Value>
class json_map_range
{
 public:
    typedef std::pair<Key, Value> entry_type;

    class iterator
    {
     public:
        typedef std::input_iterator_tag iterator_category;
        typedef entry_type value_type;
        typedef std::ptrdiff_t difference_type;
        typedef entry_type const* pointer;
        typedef entry_type const& reference;

        iterator()
        {
        }

        explicit iterator(std::shared_ptr<json_object_reader> reader)
            : reader_(std::move(reader))
        {
            decode_current();
        }

        reference operator*() const
        {
            return *current_;
        }
        pointer operator->() const
        {
            return &*current_;
        }

        iterator&
        operator++()
        {
            reader_->advance();
            decode_current();
            return *this;
        }

        // Since this is an input iterator, the returned copy refers to the
        // same position as *this.
        iterator
        operator++(int)
        {
            iterator previous = *this;
            ++*this;
            return previous;
        }

        bool
        operator==(iterator const& other) const
        {
            return this->at_end() == other.at_end()
                   && (this->at_end() || reader_ == other.reader_);
        }
        bool
        operator!=(iterator const& other) const
        {
            return !(*this == other);
        }

        // Take ownership of the current entry.
        entry_type&&
        take()
        {
            return std::move(*current_);
        }

     private:
        bool
        at_end() const
        {
            return !reader_ || !current_;
        }

        void
        decode_current()
        {
            if (reader_->at_end())
            {
                current_ = none;
                return;
            }
            std::string_view name = reader_->field_name();
            entry_type entry;
            invoke_transcoding_stage(
                transcoding_stage::KEY_DECODING, &name, [&] {
                    decode_map_key(&entry.first, string(name));
                });
            invoke_transcoding_stage(
                transcoding_stage::VALUE_DECODING, &name, [&] {
                    from_dynamic(&entry.second, reader_->field_value());
                });
            current_ = std::move(entry);
        }

        std::shared_ptr<json_object_reader> reader_;
        optional<entry_type> current_;
    };

    explicit json_map_range(std::string_view json)
        : reader_(std::make_shared<json_object_reader>(json))
    {
    }

    // the number of entries in the object
    size_t
    size() const
    {
        return reader_->size();
    }

    // Since this is a single-pass range, begin() picks up wherever the
    // previous iteration left off.
    iterator
    begin() const
    {
        return iterator(reader_);
    }

    iterator
    end() const
    {
        return iterator();
    }

 private:
    std::shared_ptr<json_object_reader> reader_;
};

} // namespace anykey

#endif
