#include <anykey/core/type_interfaces.hpp>

namespace anykey {

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}
void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}
void
from_dynamic(string* x, dynamic const& v)
{
    *x = cast<string>(v);
}

namespace {

template<class Integer>
void
read_integer(Integer* x, dynamic const& v)
{
    if (v.type() != value_type::FLOAT)
    {
        *x = checked_numeric_cast<Integer>(cast<integer>(v));
        return;
    }
    // A float is only an integer if nothing is lost in the conversion.
    double d = cast<double>(v);
    auto converted = checked_numeric_cast<Integer>(d);
    if (double(converted) != d)
    {
        ANYKEY_THROW(
            type_mismatch() << expected_value_type_info(value_type::INTEGER)
                            << actual_value_type_info(value_type::FLOAT));
    }
    *x = converted;
}

template<class Float>
void
read_float(Float* x, dynamic const& v)
{
    if (v.type() == value_type::INTEGER)
        *x = checked_numeric_cast<Float>(cast<integer>(v));
    else
        *x = checked_numeric_cast<Float>(cast<double>(v));
}

} // namespace

#define ANYKEY_DEFINE_INTEGER_INTERFACE(T)                                    \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = checked_numeric_cast<integer>(x);                                \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        read_integer(x, v);                                                   \
    }

ANYKEY_DEFINE_INTEGER_INTERFACE(signed char)
ANYKEY_DEFINE_INTEGER_INTERFACE(unsigned char)
ANYKEY_DEFINE_INTEGER_INTERFACE(signed short)
ANYKEY_DEFINE_INTEGER_INTERFACE(unsigned short)
ANYKEY_DEFINE_INTEGER_INTERFACE(signed int)
ANYKEY_DEFINE_INTEGER_INTERFACE(unsigned int)
ANYKEY_DEFINE_INTEGER_INTERFACE(signed long)
ANYKEY_DEFINE_INTEGER_INTERFACE(unsigned long)
ANYKEY_DEFINE_INTEGER_INTERFACE(signed long long)
ANYKEY_DEFINE_INTEGER_INTERFACE(unsigned long long)

#define ANYKEY_DEFINE_FLOAT_INTERFACE(T)                                      \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = double(x);                                                       \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        read_float(x, v);                                                     \
    }

ANYKEY_DEFINE_FLOAT_INTERFACE(float)
ANYKEY_DEFINE_FLOAT_INTERFACE(double)

} // namespace anykey
