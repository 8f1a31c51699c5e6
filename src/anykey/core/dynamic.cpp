#include <anykey/core/dynamic.hpp>

#include <algorithm>

#include <anykey/core/type_interfaces.hpp>
#include <anykey/core/utilities.hpp>
#include <anykey/encodings/json.hpp>

namespace anykey {

static char const* const value_type_names[] = {
    "nil", "boolean", "integer", "float", "string", "array", "map"};

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    auto index = size_t(t);
    if (index >= sizeof(value_type_names) / sizeof(value_type_names[0]))
    {
        ANYKEY_THROW(
            invalid_enum_value()
            << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s << value_type_names[index];
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        ANYKEY_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(dynamic_array const& v) : type_(value_type::ARRAY), value_(v)
{
}
dynamic::dynamic(dynamic_array&& v)
    : type_(value_type::ARRAY), value_(std::move(v))
{
}
dynamic::dynamic(dynamic_map const& v) : type_(value_type::MAP), value_(v)
{
}
dynamic::dynamic(dynamic_map&& v) : type_(value_type::MAP), value_(std::move(v))
{
}

static bool
is_map_entry(dynamic const& v)
{
    if (v.type() != value_type::ARRAY)
        return false;
    auto const& pair = cast<dynamic_array>(v);
    return pair.size() == 2 && pair[0].type() == value_type::STRING;
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    if (list.size() != 0 && std::all_of(list.begin(), list.end(), is_map_entry))
    {
        dynamic_map map;
        map.reserve(list.size());
        for (auto const& v : list)
        {
            auto const& pair = cast<dynamic_array>(v);
            map.append(pair[0], pair[1]);
        }
        type_ = value_type::MAP;
        value_ = std::move(map);
    }
    else
    {
        type_ = value_type::ARRAY;
        value_ = dynamic_array(list);
    }
}

// DYNAMIC_MAP

dynamic const*
dynamic_map::find(dynamic const& key) const
{
    auto i = std::find_if(
        entries_.rbegin(), entries_.rend(), [&](entry const& e) {
            return e.first == key;
        });
    return i == entries_.rend() ? nullptr : &i->second;
}

dynamic*
dynamic_map::find(dynamic const& key)
{
    return const_cast<dynamic*>(
        static_cast<dynamic_map const&>(*this).find(key));
}

dynamic&
dynamic_map::operator[](dynamic const& key)
{
    dynamic* existing = find(key);
    if (existing)
        return *existing;
    entries_.emplace_back(key, nil);
    return entries_.back().second;
}

// COMPARISON

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic(
        [&](auto const& x) {
            return x == cast<std::decay_t<decltype(x)>>(b);
        },
        a);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator<(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return a.type() < b.type();
    return apply_to_dynamic(
        [&](auto const& x) { return x < cast<std::decay_t<decltype(x)>>(b); },
        a);
}

size_t
hash_value(dynamic const& x)
{
    return apply_to_dynamic([](auto const& v) { return invoke_hash(v); }, x);
}

size_t
hash_value(dynamic_map const& x)
{
    return boost::hash_range(x.begin(), x.end());
}

std::ostream&
operator<<(std::ostream& s, dynamic const& v)
{
    return s << value_to_json(v);
}

// FIELDS

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        ANYKEY_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    *v = r.find(dynamic(field));
    return *v != nullptr;
}

dynamic const&
get_union_tag(dynamic_map const& map)
{
    if (map.size() != 1)
    {
        ANYKEY_THROW(multifield_union());
    }
    return map.begin()->first;
}

std::ostream&
operator<<(std::ostream& s, std::list<dynamic> const& path)
{
    return s << dynamic(dynamic_array(path.begin(), path.end()));
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    auto* path = get_error_info<dynamic_value_path_info>(e);
    if (path)
        path->push_front(path_element);
    else
        e << dynamic_value_path_info(std::list<dynamic>{path_element});
}

} // namespace anykey
