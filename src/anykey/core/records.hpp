#ifndef ANYKEY_CORE_RECORDS_HPP
#define ANYKEY_CORE_RECORDS_HPP

#include <tuple>

#include <boost/functional/hash.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/variadic_seq_to_seq.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/tuple/push_back.hpp>

#include <anykey/core/omissible.hpp>
#include <anykey/core/type_interfaces.hpp>

// RECORDS - Records are plain structs that are encoded as maps from field
// names to field values.
//
// A record's fields are listed as a preprocessor sequence. Each entry is
// either (name) or (name, strategy), where the strategy controls how that one
// field is written to and read from the record. For example:
//
//   struct point { int x; int y; std::map<point_key, int> labels; };
//   ANYKEY_DEFINE_RECORD_INTERFACE(
//       point, (x)(y)(labels, anykey::any_key_map))
//
// These macros must be invoked in the namespace of the struct so that the
// functions they define are found by argument-dependent lookup.

namespace anykey {

// A field strategy provides static write(record, field_name, field_value) and
// read(&field_value, record, field_name) functions. This one defers to the
// overloadable write_field_to_record and read_field_from_record functions.
struct default_field_strategy
{
    template<class Field>
    static void
    write(
        dynamic_map& record,
        string const& field_name,
        Field const& field_value)
    {
        write_field_to_record(record, field_name, field_value);
    }

    template<class Field>
    static void
    read(
        Field* field_value,
        dynamic_map const& record,
        string const& field_name)
    {
        read_field_from_record(field_value, record, field_name);
    }
};

} // namespace anykey

#define ANYKEY_RECORD_FIELD_NAME(field) BOOST_PP_TUPLE_ELEM(0, field)

#define ANYKEY_RECORD_FIELD_STRATEGY(field)                                   \
    BOOST_PP_TUPLE_ELEM(                                                      \
        1,                                                                    \
        BOOST_PP_TUPLE_PUSH_BACK(field, ::anykey::default_field_strategy))

#define ANYKEY_RECORD_FIELDS(fields) BOOST_PP_VARIADIC_SEQ_TO_SEQ(fields)

#define ANYKEY_WRITE_RECORD_FIELD(r, record, field)                           \
    ANYKEY_RECORD_FIELD_STRATEGY(field)::write(                               \
        record,                                                               \
        BOOST_PP_STRINGIZE(ANYKEY_RECORD_FIELD_NAME(field)),                  \
        x.ANYKEY_RECORD_FIELD_NAME(field));

#define ANYKEY_READ_RECORD_FIELD(r, record, field)                            \
    ANYKEY_RECORD_FIELD_STRATEGY(field)::read(                                \
        &x->ANYKEY_RECORD_FIELD_NAME(field),                                  \
        record,                                                               \
        BOOST_PP_STRINGIZE(ANYKEY_RECORD_FIELD_NAME(field)));

#define ANYKEY_DEFINE_RECORD_INTERFACE(T, fields)                             \
    inline void to_dynamic(::anykey::dynamic* v, T const& x)                  \
    {                                                                         \
        ::anykey::dynamic_map record;                                         \
        BOOST_PP_SEQ_FOR_EACH(                                                \
            ANYKEY_WRITE_RECORD_FIELD, record, ANYKEY_RECORD_FIELDS(fields))  \
        *v = std::move(record);                                               \
    }                                                                         \
    inline void from_dynamic(T* x, ::anykey::dynamic const& v)                \
    {                                                                         \
        auto const& record = ::anykey::cast< ::anykey::dynamic_map>(v);       \
        BOOST_PP_SEQ_FOR_EACH(                                                \
            ANYKEY_READ_RECORD_FIELD, record, ANYKEY_RECORD_FIELDS(fields))   \
    }

#define ANYKEY_RECORD_MEMBER(s, object, field)                                \
    object.ANYKEY_RECORD_FIELD_NAME(field)

#define ANYKEY_TIE_RECORD_FIELDS(object, fields)                              \
    std::tie(BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(                        \
        ANYKEY_RECORD_MEMBER, object, ANYKEY_RECORD_FIELDS(fields))))

// Define == and != in terms of the listed fields.
#define ANYKEY_DEFINE_RECORD_EQUALITY(T, fields)                              \
    inline bool operator==(T const& a, T const& b)                            \
    {                                                                         \
        return ANYKEY_TIE_RECORD_FIELDS(a, fields)                            \
               == ANYKEY_TIE_RECORD_FIELDS(b, fields);                        \
    }                                                                         \
    inline bool operator!=(T const& a, T const& b)                            \
    {                                                                         \
        return !(a == b);                                                     \
    }

// Define < as a lexicographic comparison of the listed fields, in order.
#define ANYKEY_DEFINE_RECORD_ORDERING(T, fields)                              \
    inline bool operator<(T const& a, T const& b)                             \
    {                                                                         \
        return ANYKEY_TIE_RECORD_FIELDS(a, fields)                            \
               < ANYKEY_TIE_RECORD_FIELDS(b, fields);                         \
    }

#define ANYKEY_HASH_RECORD_FIELD(r, object, field)                            \
    boost::hash_combine(seed, object.ANYKEY_RECORD_FIELD_NAME(field));

// Define hash_value (for boost::hash) in terms of the listed fields.
#define ANYKEY_DEFINE_RECORD_HASH(T, fields)                                  \
    inline size_t hash_value(T const& x)                                      \
    {                                                                         \
        size_t seed = 0;                                                      \
        BOOST_PP_SEQ_FOR_EACH(                                                \
            ANYKEY_HASH_RECORD_FIELD, x, ANYKEY_RECORD_FIELDS(fields))        \
        return seed;                                                          \
    }

#endif
