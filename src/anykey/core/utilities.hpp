#ifndef ANYKEY_CORE_UTILITIES_HPP
#define ANYKEY_CORE_UTILITIES_HPP

#include <boost/functional/hash.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <anykey/core/exception.hpp>

namespace anykey {

using boost::lexical_cast;

template<class T>
size_t
invoke_hash(T const& x)
{
    return boost::hash<T>()(x);
}

// checked_numeric_cast<Target>(x) is boost::numeric_cast, except that a
// failed conversion throws a bad_numeric_cast that can carry error info, so
// it can be annotated with where it happened as it propagates.
template<class Target, class Source>
Target
checked_numeric_cast(Source x)
{
    try
    {
        return boost::numeric_cast<Target>(x);
    }
    catch (boost::numeric::bad_numeric_cast& e)
    {
        ANYKEY_THROW(boost::enable_error_info(e));
    }
}

// Thrown when a fixed-size array (or tuple) is read from an array with the
// wrong number of elements.
ANYKEY_DEFINE_EXCEPTION(array_size_mismatch)
ANYKEY_DEFINE_ERROR_INFO(size_t, expected_size)
ANYKEY_DEFINE_ERROR_INFO(size_t, actual_size)

void
check_array_size(size_t expected_size, size_t actual_size);

// Thrown when an enum is given (or holds) a value outside its cases.
ANYKEY_DEFINE_EXCEPTION(invalid_enum_value)
ANYKEY_DEFINE_ERROR_INFO(string, enum_id)
ANYKEY_DEFINE_ERROR_INFO(int, enum_value)

// Thrown when a string names none of an enum's cases.
// (This also carries an enum_id_info.)
ANYKEY_DEFINE_EXCEPTION(invalid_enum_string)
ANYKEY_DEFINE_ERROR_INFO(string, enum_string)

// For errors reported by a third-party library, the library's own message.
ANYKEY_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace anykey

#endif
