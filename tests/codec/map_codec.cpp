#include <anykey/codec/map_codec.hpp>

#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>
#include <boost/range/adaptor/transformed.hpp>

#include <anykey/codec/collections.hpp>
#include <anykey/testing.hpp>

#include "test_types.hpp"

using namespace anykey;
using codec_testing::test;

namespace {

// A value whose conversion to dynamic fails with an exception that isn't a
// boost::exception.
struct unencodable
{
};

void
to_dynamic(dynamic*, unencodable const&)
{
    throw std::runtime_error("cannot encode");
}

template<class Exception>
transcoding_stage
stage_of(Exception const& e)
{
    return get_required_error_info<transcoding_stage_info>(e);
}

} // namespace

TEST_CASE("transcoding_stage streaming", "[codec][map]")
{
    REQUIRE(
        lexical_cast<string>(transcoding_stage::KEY_ENCODING)
        == "key encoding");
    REQUIRE(
        lexical_cast<string>(transcoding_stage::VALUE_DECODING)
        == "value decoding");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(transcoding_stage(-1)), invalid_enum_value);
}

TEST_CASE("struct key map encoding", "[codec][map]")
{
    std::vector<std::pair<test, test>> entries{{test{3, 5}, test{7, 9}}};

    string json;
    write_json_map(json, entries.begin(), entries.end());
    REQUIRE(json == R"({"{\"a\":3,\"b\":5}":{"a":7,"b":9}})");

    auto decoded = json_to_map<test, test>(json);
    REQUIRE(decoded.size() == 1);
    REQUIRE((decoded.begin()->first == test{3, 5}));
    REQUIRE((decoded.begin()->second == test{7, 9}));
}

TEST_CASE("string key map encoding", "[codec][map]")
{
    std::map<string, int> map{{"foo", 1234}};
    string json;
    write_json_map(json, map.begin(), map.end());
    REQUIRE(json == R"({"foo":1234})");
    REQUIRE(json == value_to_json(to_dynamic(map)));

    INFO("Keys that need escaping are escaped exactly as the generic writer "
         "escapes them.")
    std::map<string, int> tricky{
        {"quote\"", 1}, {"back\\slash", 2}, {"caf\xc3\xa9", 3}};
    json_writer_config ascii;
    ascii.ensure_ascii = true;
    for (auto const& config : {json_writer_config(), ascii})
    {
        string tricky_json;
        write_json_map(tricky_json, tricky.begin(), tricky.end(), config);
        REQUIRE(tricky_json == value_to_json(to_dynamic(tricky), config));
    }
}

TEST_CASE("empty map encoding", "[codec][map]")
{
    std::vector<std::pair<test, test>> entries;
    string json;
    write_json_map(json, entries.begin(), entries.end());
    REQUIRE(json == "{}");

    REQUIRE((json_to_map<test, test>("{}").empty()));
    REQUIRE((json_to_vec<string, int>("  { }  ").empty()));
}

TEST_CASE("map encoding order", "[codec][map]")
{
    std::vector<std::pair<string, int>> strings{{"b", 1}, {"a", 2}};
    string json;
    write_json_map(json, strings.begin(), strings.end());
    REQUIRE(json == R"({"b":1,"a":2})");

    std::vector<std::pair<int, int>> numbers{{2, 0}, {1, 0}, {3, 0}};
    json.clear();
    write_json_map(json, numbers.begin(), numbers.end());
    REQUIRE(json == R"({"2":0,"1":0,"3":0})");

    // Decoding into a sequence preserves the document order.
    REQUIRE((json_to_vec<int, int>(json) == numbers));
}

TEST_CASE("duplicate map keys", "[codec][map]")
{
    std::vector<std::pair<string, int>> entries{{"a", 1}, {"a", 2}};
    string json;
    write_json_map(json, entries.begin(), entries.end());
    REQUIRE(json == R"({"a":1,"a":2})");

    REQUIRE((json_to_vec<string, int>(json) == entries));
    // Associative targets keep the last one.
    REQUIRE((json_to_map<string, int>(json).at("a") == 2));
}

TEST_CASE("map encoding to streams", "[codec][map]")
{
    std::map<test, int> map{{test{1, 2}, 3}, {test{4, 5}, 6}};

    std::ostringstream stream;
    write_json_map(stream, map.begin(), map.end());

    string json;
    write_json_map(json, map.begin(), map.end());
    REQUIRE(stream.str() == json);
}

TEST_CASE("map encoding appends to strings", "[codec][map]")
{
    std::map<int, int> map{{1, 2}};
    string json = "prefix ";
    write_json_map(json, map.begin(), map.end());
    REQUIRE(json == R"(prefix {"1":2})");
}

TEST_CASE("map encoding from iterators that yield by value", "[codec][map]")
{
    std::vector<int> numbers{1, 2, 3};
    auto entries
        = numbers | boost::adaptors::transformed([](int n) {
              return std::make_pair(test{n, -n}, lexical_cast<string>(n));
          });
    string json;
    write_json_map(json, boost::begin(entries), boost::end(entries));
    REQUIRE(
        json
        == R"({"{\"a\":1,\"b\":-1}":"1","{\"a\":2,\"b\":-2}":"2",)"
           R"("{\"a\":3,\"b\":-3}":"3"})");
}

TEST_CASE("map encoding from single-pass iterators", "[codec][map]")
{
    string original = R"({"{\"a\":1,\"b\":2}":3,"{\"a\":0,\"b\":0}":4})";
    // Transcode directly from a lazily decoded range.
    auto entries = json_to_iter<test, int>(original);
    string json;
    write_json_map(json, entries.begin(), entries.end());
    REQUIRE(json == original);
}

TEST_CASE("lazy map decoding", "[codec][map]")
{
    auto entries = json_to_iter<int, string>(R"({"1":"one","x":"two"})");
    REQUIRE(entries.size() == 2);

    auto i = entries.begin();
    REQUIRE(i != entries.end());
    REQUIRE(i->first == 1);
    REQUIRE(i->second == "one");

    // The second entry only fails once it's reached.
    try
    {
        ++i;
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::KEY_DECODING);
        REQUIRE(get_required_error_info<map_key_text_info>(e) == "x");
    }
}

TEST_CASE("truncated map JSON", "[codec][map]")
{
    try
    {
        json_to_map<test, test>(R"({"{\"a\":3,\"b\":5}":{"a":7)");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::OBJECT_PARSING);
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
    }
}

TEST_CASE("non-object map JSON", "[codec][map]")
{
    try
    {
        json_to_map<int, int>("[1, 2]");
        FAIL("no exception thrown");
    }
    catch (json_object_expected& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::OBJECT_PARSING);
        REQUIRE(
            get_required_error_info<actual_value_type_info>(e)
            == value_type::ARRAY);
    }

    REQUIRE_THROWS_AS((json_to_map<int, int>("12")), json_object_expected);
    REQUIRE_THROWS_AS((json_to_map<int, int>("null")), json_object_expected);
}

TEST_CASE("invalid map keys", "[codec][map]")
{
    try
    {
        json_to_map<int, int>(R"({"5":5,"five":5})");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::KEY_DECODING);
        REQUIRE(get_required_error_info<map_key_text_info>(e) == "five");
    }

    try
    {
        json_to_map<test, int>(R"({"{\"a\":1}":5})");
        FAIL("no exception thrown");
    }
    catch (missing_field& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::KEY_DECODING);
        REQUIRE(get_required_error_info<field_name_info>(e) == "b");
        REQUIRE(
            get_required_error_info<map_key_text_info>(e) == R"({"a":1})");
    }
}

TEST_CASE("invalid map values", "[codec][map]")
{
    try
    {
        json_to_map<int, int>(R"({"5":"five"})");
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::VALUE_DECODING);
        REQUIRE(get_required_error_info<map_key_text_info>(e) == "5");
        REQUIRE(
            get_required_error_info<expected_value_type_info>(e)
            == value_type::INTEGER);
    }
}

TEST_CASE("unencodable map keys", "[codec][map]")
{
    std::map<uint64_t, int> map{{std::numeric_limits<uint64_t>::max(), 1}};
    string json;
    try
    {
        write_json_map(json, map.begin(), map.end());
        FAIL("no exception thrown");
    }
    catch (boost::numeric::bad_numeric_cast& e)
    {
        auto const* stage = get_error_info<transcoding_stage_info>(e);
        REQUIRE(stage);
        REQUIRE(*stage == transcoding_stage::KEY_ENCODING);
    }

    INFO("Keys that aren't valid UTF-8 can't be written.")
    std::map<string, int> bad_utf8{{"a\xff", 1}};
    try
    {
        map_to_json(bad_utf8);
        FAIL("no exception thrown");
    }
    catch (json_encoding_error& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::KEY_ENCODING);
    }
}

TEST_CASE("unencodable map values", "[codec][map]")
{
    std::vector<std::pair<int, uint64_t>> entries{
        {1, 1}, {2, std::numeric_limits<uint64_t>::max()}};
    string json;
    try
    {
        write_json_map(json, entries.begin(), entries.end());
        FAIL("no exception thrown");
    }
    catch (boost::numeric::bad_numeric_cast& e)
    {
        auto const* stage = get_error_info<transcoding_stage_info>(e);
        REQUIRE(stage);
        REQUIRE(*stage == transcoding_stage::VALUE_ENCODING);
        auto const* key = get_error_info<map_key_text_info>(e);
        REQUIRE(key);
        REQUIRE(*key == "2");
    }
    // Entries before the failure have already been written.
    REQUIRE(json == R"({"1":1)");
}

TEST_CASE("out-of-range decoded values", "[codec][map]")
{
    try
    {
        json_to_map<int, unsigned char>(R"({"1":1,"2":300})");
        FAIL("no exception thrown");
    }
    catch (boost::numeric::bad_numeric_cast& e)
    {
        auto const* stage = get_error_info<transcoding_stage_info>(e);
        REQUIRE(stage);
        REQUIRE(*stage == transcoding_stage::VALUE_DECODING);
        auto const* key = get_error_info<map_key_text_info>(e);
        REQUIRE(key);
        REQUIRE(*key == "2");
    }
}

TEST_CASE("foreign encoding errors", "[codec][map]")
{
    std::map<string, unencodable> map{{"x", unencodable()}};
    try
    {
        map_to_json(map);
        FAIL("no exception thrown");
    }
    catch (map_transcoding_failed& e)
    {
        REQUIRE(stage_of(e) == transcoding_stage::VALUE_ENCODING);
        REQUIRE(get_required_error_info<map_key_text_info>(e) == "x");
        REQUIRE(
            get_required_error_info<internal_error_message_info>(e)
            == "cannot encode");
    }
}
