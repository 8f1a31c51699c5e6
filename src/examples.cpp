// Examples of how to use anykey

#include <map>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include <anykey/codec.hpp>
#include <anykey/core/logging.hpp>

using namespace anykey;

namespace examples {

struct test
{
    int a = 0;
    int b = 0;
};

ANYKEY_DEFINE_RECORD_INTERFACE(test, (a)(b))
ANYKEY_DEFINE_RECORD_EQUALITY(test, (a)(b))
ANYKEY_DEFINE_RECORD_ORDERING(test, (a)(b))
ANYKEY_DEFINE_RECORD_HASH(test, (a)(b))

struct nested_test
{
    std::unordered_map<test, test, boost::hash<test>> map;
    std::map<test, test> btr;
    std::vector<std::pair<test, test>> vec;
};

ANYKEY_DEFINE_RECORD_INTERFACE(
    nested_test,
    (map, anykey::any_key_map)(btr, anykey::any_key_map)(
        vec, anykey::any_key_vec))
ANYKEY_DEFINE_RECORD_EQUALITY(nested_test, (map)(btr)(vec))

} // namespace examples

using examples::nested_test;
using examples::test;

static void
check(bool condition, char const* description)
{
    if (!condition)
        throw std::runtime_error(string("check failed: ") + description);
}

static void
run_examples(spdlog::logger& log)
{
    std::unordered_map<test, test, boost::hash<test>> map;
    map[test{3, 5}] = test{7, 9};

    // The generic encoding of a map with struct keys is an array of
    // key/value pairs.
    log.info("0 - {}", value_to_json(to_dynamic(map)));

    // Encoding each key by hand gives the canonical form, but it copies the
    // whole map.
    // {"{\"a\":3,\"b\":5}":{"a":7,"b":9}}
    std::map<string, test> string_map;
    for (auto const& entry : map)
        string_map[value_to_json(to_dynamic(entry.first))] = entry.second;
    auto canonical = value_to_json(to_dynamic(string_map));
    log.info("1 - {}", canonical);

    // map_to_json produces the same output, one entry at a time.
    auto serialized = map_to_json(map);
    log.info("2 - {}", serialized);
    check(serialized == canonical, "map output is canonical");

    // Vectors of pairs work too.
    std::vector<std::pair<test, test>> vec{{test{3, 5}, test{7, 9}}};
    serialized = vec_to_json(vec);
    log.info("3 - {}", serialized);
    check(serialized == canonical, "vector output is canonical");

    // So does any other range of pairs.
    std::map<test, test> btree;
    btree[test{3, 5}] = test{7, 9};
    serialized = iter_to_json(btree.begin(), btree.end());
    log.info("4 - {}", serialized);
    check(serialized == canonical, "iterator output is canonical");

    // The JSON can be read back into maps or vectors.
    auto deserialized_map = json_to_map<test, test, decltype(map)>(serialized);
    check(deserialized_map == map, "map round trip");
    auto deserialized_vec = json_to_vec<test, test>(serialized);
    check(deserialized_vec == vec, "vector round trip");

    // Reading struct keys as strings gives their JSON text.
    auto with_string_keys = json_to_map<string, test>(serialized);
    log.info("5 - {}", value_to_json(to_dynamic(with_string_keys)));

    // json_to_iter decodes entries lazily, so they can be added to existing
    // collections.
    {
        std::map<string, test> extended;
        auto entries = json_to_iter<string, test>(serialized);
        for (auto const& entry : entries)
            extended.insert(entry);
        log.info("6 - {}", value_to_json(to_dynamic(extended)));
    }
    {
        std::map<test, test> extended;
        auto entries = json_to_iter<test, test>(serialized);
        for (auto const& entry : entries)
            extended.insert(entry);
        log.info("7 - {}", value_to_json(to_dynamic(extended)));
    }

    // With string keys, the output is identical to the generic encoding.
    std::map<string, int> simple{{"foo", 1234}};
    auto generic = value_to_json(to_dynamic(simple));
    serialized = map_to_json(simple);
    log.info("8 - {}", serialized);
    check(serialized == generic, "string keys match the generic encoding");
    check(
        json_to_map<string, int>(generic)
            == from_dynamic<std::map<string, int>>(parse_json_value(generic)),
        "string keys decode like the generic encoding");

    // Maps inside records can be encoded as objects with the any_key_map and
    // any_key_vec field strategies.
    nested_test nested;
    nested.map = map;
    nested.btr = btree;
    nested.vec = vec;
    serialized = value_to_json(to_dynamic(nested));
    log.info("9 - {}", serialized);
    check(
        from_dynamic<nested_test>(parse_json_value(serialized)) == nested,
        "nested round trip");
}

int
main()
{
    auto log = get_anykey_logger();
    try
    {
        run_examples(*log);
    }
    catch (std::exception& e)
    {
        log->error("example failed: {}", e.what());
        return 1;
    }
    return 0;
}
