#ifndef ANYKEY_CORE_DYNAMIC_HPP
#define ANYKEY_CORE_DYNAMIC_HPP

#include <list>
#include <ostream>

#include <anykey/core/exception.hpp>
#include <anykey/core/type_definitions.hpp>

namespace anykey {

std::ostream&
operator<<(std::ostream& s, value_type t);

// TYPES

// value_type_of<T>::value is the value_type that a dynamic holding a T has.
template<class T>
struct value_type_of
{
};

#define ANYKEY_DEFINE_VALUE_TYPE_OF(T, type)                                  \
    template<>                                                                \
    struct value_type_of<T>                                                   \
    {                                                                         \
        static value_type const value = value_type::type;                     \
    };

ANYKEY_DEFINE_VALUE_TYPE_OF(nil_t, NIL)
ANYKEY_DEFINE_VALUE_TYPE_OF(bool, BOOLEAN)
ANYKEY_DEFINE_VALUE_TYPE_OF(integer, INTEGER)
ANYKEY_DEFINE_VALUE_TYPE_OF(double, FLOAT)
ANYKEY_DEFINE_VALUE_TYPE_OF(string, STRING)
ANYKEY_DEFINE_VALUE_TYPE_OF(dynamic_array, ARRAY)
ANYKEY_DEFINE_VALUE_TYPE_OF(dynamic_map, MAP)

ANYKEY_DEFINE_EXCEPTION(type_mismatch)
ANYKEY_DEFINE_ERROR_INFO(value_type, expected_value_type)
ANYKEY_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Throw type_mismatch unless :expected and :actual are the same.
void
check_type(value_type expected, value_type actual);

// cast<T>(v) gets at the T inside :v, throwing type_mismatch if :v holds
// something else.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

// Call :fn with whatever :v holds. :fn must accept all seven value types.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default:
            return fn(nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::INTEGER:
            return fn(cast<integer>(v));
        case value_type::FLOAT:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::MAP:
            return fn(cast<dynamic_map>(v));
    }
}

// Dynamic values are written to streams as compact JSON.
std::ostream&
operator<<(std::ostream& s, dynamic const& v);

size_t
hash_value(dynamic const& x);
size_t
hash_value(dynamic_map const& x);

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

// Everything that converts to and from dynamic does it through
// to_dynamic(&v, x) and from_dynamic(&x, v). These are the value-returning
// forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// FIELDS

ANYKEY_DEFINE_EXCEPTION(missing_field)
ANYKEY_DEFINE_ERROR_INFO(string, field_name)

// Get the value of the field named :field in :r, throwing missing_field if
// there isn't one.
dynamic const&
get_field(dynamic_map const& r, string const& field);

// Same, but a missing field is reported by returning false.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);

ANYKEY_DEFINE_EXCEPTION(multifield_union)

// A union value is a map with exactly one entry. Get its key.
dynamic const&
get_union_tag(dynamic_map const& map);

// the location within a dynamic value where an error was found, outermost
// element first
ANYKEY_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

std::ostream&
operator<<(std::ostream& s, std::list<dynamic> const& path);

// Prepend :path_element to the dynamic_value_path of :e.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// Record fields go through these, so that a field type can change how it's
// stored (see omissible).
template<class Field>
void
read_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    auto const& v = get_field(record, field_name);
    try
    {
        from_dynamic(field_value, v);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, field_name);
        throw;
    }
}
template<class Field>
void
write_field_to_record(
    dynamic_map& record, string const& field_name, Field const& field_value)
{
    record.append(field_name, to_dynamic(field_value));
}

} // namespace anykey

#endif
