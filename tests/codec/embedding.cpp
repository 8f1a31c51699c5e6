#include <anykey/codec/embedding.hpp>

#include <map>
#include <vector>

#include <anykey/testing.hpp>

#include "test_types.hpp"

using namespace anykey;
using codec_testing::hash_map;
using codec_testing::test;
using codec_testing::test_with_string;

namespace embedding_testing {

struct nested_test
{
    hash_map<test, test> map;
    std::map<test, test> btr;
    std::vector<std::pair<test, test>> vec;
};

ANYKEY_DEFINE_RECORD_INTERFACE(
    nested_test,
    (map, anykey::any_key_map)(btr, anykey::any_key_map)(
        vec, anykey::any_key_vec))
ANYKEY_DEFINE_RECORD_EQUALITY(nested_test, (map)(btr)(vec))

struct with_map
{
    hash_map<test_with_string, test_with_string> inner;
};

ANYKEY_DEFINE_RECORD_INTERFACE(with_map, (inner, anykey::any_key_map))
ANYKEY_DEFINE_RECORD_EQUALITY(with_map, (inner))

struct with_vec
{
    std::vector<std::pair<test_with_string, test_with_string>> inner;
};

ANYKEY_DEFINE_RECORD_INTERFACE(with_vec, (inner, anykey::any_key_vec))
ANYKEY_DEFINE_RECORD_EQUALITY(with_vec, (inner))
ANYKEY_DEFINE_RECORD_HASH(with_vec, (inner))

struct one_level
{
    with_map map;
    with_vec vec;
};

ANYKEY_DEFINE_RECORD_INTERFACE(one_level, (map)(vec))
ANYKEY_DEFINE_RECORD_EQUALITY(one_level, (map)(vec))

struct two_level
{
    hash_map<with_vec, with_map> map;
    std::vector<std::pair<with_map, with_vec>> vec;
};

ANYKEY_DEFINE_RECORD_INTERFACE(
    two_level, (map, anykey::any_key_map)(vec, anykey::any_key_vec))
ANYKEY_DEFINE_RECORD_EQUALITY(two_level, (map)(vec))

struct keyed_list
{
    std::vector<std::pair<int, string>> inner;
};

ANYKEY_DEFINE_RECORD_INTERFACE(keyed_list, (inner, anykey::any_key_vec))
ANYKEY_DEFINE_RECORD_EQUALITY(keyed_list, (inner))

struct plain_map
{
    std::map<int, int> inner;
};

ANYKEY_DEFINE_RECORD_INTERFACE(plain_map, (inner))

struct embedded_map
{
    std::map<int, int> inner;
};

ANYKEY_DEFINE_RECORD_INTERFACE(embedded_map, (inner, anykey::any_key_map))

} // namespace embedding_testing

using namespace embedding_testing;

namespace {

with_map
make_with_map()
{
    with_map x;
    x.inner[test_with_string{3, 5, "foo"}] = test_with_string{7, 9, "bar"};
    return x;
}

with_vec
make_with_vec()
{
    with_vec x;
    x.inner.emplace_back(
        test_with_string{3, 5, "foo"}, test_with_string{7, 9, "bar"});
    return x;
}

} // namespace

TEST_CASE("embedded maps are written as objects", "[codec][embedding]")
{
    plain_map plain;
    plain.inner[1] = 2;
    REQUIRE(
        value_to_json(to_dynamic(plain))
        == R"({"inner":[{"key":1,"value":2}]})");

    embedded_map embedded;
    embedded.inner[1] = 2;
    REQUIRE(value_to_json(to_dynamic(embedded)) == R"({"inner":{"1":2}})");

    auto decoded = from_dynamic<embedded_map>(
        parse_json_value(R"({"inner":{"1":2,"3":4}})"));
    REQUIRE((decoded.inner == std::map<int, int>{{1, 2}, {3, 4}}));
}

TEST_CASE("embedded maps match the map encoding", "[codec][embedding]")
{
    nested_test nested;
    nested.map[test{3, 5}] = test{7, 9};
    nested.btr[test{3, 5}] = test{7, 9};
    nested.vec.emplace_back(test{3, 5}, test{7, 9});

    auto canonical = map_to_json(nested.btr);
    REQUIRE(
        value_to_json(to_dynamic(nested))
        == R"({"map":)" + canonical + R"(,"btr":)" + canonical + R"(,"vec":)"
               + canonical + "}");

    REQUIRE(
        from_dynamic<nested_test>(parse_json_value(
            value_to_json(to_dynamic(nested))))
        == nested);
}

TEST_CASE("embedded maps at one level", "[codec][embedding]")
{
    one_level outer{make_with_map(), make_with_vec()};
    test_regular_value(outer);

    auto json = value_to_json(to_dynamic(outer));
    REQUIRE(from_dynamic<one_level>(parse_json_value(json)) == outer);

    // Records containing embedded maps can also be map values and keys.
    hash_map<string, one_level> by_name;
    by_name["top"] = outer;
    auto by_name_json = map_to_json(by_name);
    REQUIRE(by_name_json == value_to_json(to_dynamic(by_name)));
    REQUIRE(
        (json_to_map<string, one_level, hash_map<string, one_level>>(
             by_name_json)
         == by_name));

    hash_map<test_with_string, one_level> by_key;
    by_key[test_with_string{10, 11, "bbq"}] = outer;
    REQUIRE(
        (json_to_map<
             test_with_string,
             one_level,
             hash_map<test_with_string, one_level>>(map_to_json(by_key))
         == by_key));
}

TEST_CASE("embedded maps at two levels", "[codec][embedding]")
{
    two_level outer;
    outer.map[make_with_vec()] = make_with_map();
    outer.vec.emplace_back(make_with_map(), make_with_vec());

    auto json = value_to_json(to_dynamic(outer));
    REQUIRE(from_dynamic<two_level>(parse_json_value(json)) == outer);
}

TEST_CASE("empty embedded maps", "[codec][embedding]")
{
    nested_test empty;
    auto json = value_to_json(to_dynamic(empty));
    REQUIRE(json == R"({"map":{},"btr":{},"vec":{}})");
    REQUIRE(from_dynamic<nested_test>(parse_json_value(json)) == empty);
}

TEST_CASE("direct embedding strategy calls", "[codec][embedding]")
{
    std::vector<std::pair<int, string>> vec{{2, "b"}, {1, "a"}};
    dynamic v;
    any_key_vec::to_dynamic(&v, vec);
    REQUIRE(v == dynamic({{"2", "b"}, {"1", "a"}}));

    std::vector<std::pair<int, string>> decoded;
    any_key_vec::from_dynamic(&decoded, v);
    REQUIRE(decoded == vec);

    std::map<int, string> map;
    any_key_map::from_dynamic(&map, v);
    REQUIRE(map.at(1) == "a");
}

TEST_CASE("embedded vectors keep order and repeats", "[codec][embedding]")
{
    keyed_list x;
    x.inner = {{2, "b"}, {1, "a"}, {2, "c"}};

    auto json = value_to_json(to_dynamic(x));
    REQUIRE(json == R"({"inner":{"2":"b","1":"a","2":"c"}})");
    REQUIRE(json == R"({"inner":)" + vec_to_json(x.inner) + "}");
    REQUIRE(from_dynamic<keyed_list>(parse_json_value(json)) == x);

    // Struct keys behave the same way.
    with_vec y;
    y.inner = {
        {test_with_string{2, 0, "b"}, test_with_string{1, 1, "x"}},
        {test_with_string{1, 0, "a"}, test_with_string{2, 2, "y"}},
        {test_with_string{2, 0, "b"}, test_with_string{3, 3, "z"}}};
    auto y_json = value_to_json(to_dynamic(y));
    REQUIRE(y_json == R"({"inner":)" + vec_to_json(y.inner) + "}");
    REQUIRE(from_dynamic<with_vec>(parse_json_value(y_json)) == y);
}

TEST_CASE("embedded maps with several entries", "[codec][embedding]")
{
    embedded_map x;
    x.inner = {{3, 30}, {1, 10}, {2, 20}};
    auto json = value_to_json(to_dynamic(x));
    REQUIRE(json == R"({"inner":{"1":10,"2":20,"3":30}})");
    REQUIRE(json == R"({"inner":)" + map_to_json(x.inner) + "}");

    // Repeated keys in the text resolve to the last value.
    auto decoded = from_dynamic<embedded_map>(
        parse_json_value(R"({"inner":{"2":1,"1":5,"2":7}})"));
    REQUIRE((decoded.inner == std::map<int, int>{{1, 5}, {2, 7}}));
}

TEST_CASE("embedded map errors", "[codec][embedding]")
{
    try
    {
        from_dynamic<embedded_map>(
            parse_json_value(R"({"inner":{"1":2,"x":4}})"));
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(
            get_required_error_info<transcoding_stage_info>(e)
            == transcoding_stage::KEY_DECODING);
        REQUIRE(get_required_error_info<map_key_text_info>(e) == "x");
        std::list<dynamic> expected_path{dynamic("inner"), dynamic("x")};
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == expected_path);
    }

    try
    {
        from_dynamic<embedded_map>(
            parse_json_value(R"({"inner":{"1":"two"}})"));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<transcoding_stage_info>(e)
            == transcoding_stage::VALUE_DECODING);
    }

    REQUIRE_THROWS_AS(
        from_dynamic<embedded_map>(parse_json_value(R"({"inner":[1]})")),
        type_mismatch);
    REQUIRE_THROWS_AS(
        from_dynamic<embedded_map>(parse_json_value("{}")), missing_field);
}
