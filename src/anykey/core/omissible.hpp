#ifndef ANYKEY_CORE_OMISSIBLE_HPP
#define ANYKEY_CORE_OMISSIBLE_HPP

#include <ostream>

#include <anykey/core/type_interfaces.hpp>

namespace anykey {

// omissible<T> is an optional<T> that, as a record field, is left out of the
// record entirely when it's none (and reads as none when it's missing).
// Everywhere else, it behaves exactly like an optional<T>.
template<class T>
struct omissible : optional<T>
{
    using optional<T>::optional;
    using optional<T>::operator=;

    omissible()
    {
    }
    omissible(optional<T> const& x) : optional<T>(x)
    {
    }
    omissible(optional<T>&& x) : optional<T>(std::move(x))
    {
    }
};

template<class T>
optional<T> const&
as_optional(omissible<T> const& x)
{
    return x;
}

template<class T>
void
write_field_to_record(
    dynamic_map& record, string const& field_name, omissible<T> const& field)
{
    if (field)
        write_field_to_record(record, field_name, *field);
}

template<class T>
void
read_field_from_record(
    omissible<T>* field, dynamic_map const& record, string const& field_name)
{
    dynamic const* value;
    if (!get_field(&value, record, field_name))
    {
        *field = none;
        return;
    }
    try
    {
        T x;
        from_dynamic(&x, *value);
        *field = std::move(x);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, field_name);
        throw;
    }
}

template<class T>
void
to_dynamic(dynamic* v, omissible<T> const& x)
{
    to_dynamic(v, as_optional(x));
}

template<class T>
void
from_dynamic(omissible<T>* x, dynamic const& v)
{
    from_dynamic(static_cast<optional<T>*>(x), v);
}

template<class T>
std::ostream&
operator<<(std::ostream& s, omissible<T> const& x)
{
    if (x)
        return s << *x;
    return s << "none";
}

template<class T>
size_t
hash_value(omissible<T> const& x)
{
    return x ? invoke_hash(*x) : 0;
}

} // namespace anykey

#endif
