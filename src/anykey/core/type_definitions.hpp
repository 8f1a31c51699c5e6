#ifndef ANYKEY_CORE_TYPE_DEFINITIONS_HPP
#define ANYKEY_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

namespace anykey {

using std::string;

using boost::none;
using boost::optional;

// some(x) wraps a copy of :x in an optional.
template<class T>
optional<std::decay_t<T>>
some(T&& x)
{
    return optional<std::decay_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// the unit type (JSON null)
struct nil_t
{
};
static nil_t nil;

// the kinds of values that a dynamic can hold, one for each kind of JSON value
enum class value_type
{
    NIL,
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
    ARRAY,
    MAP
};

struct dynamic;
class dynamic_map;

typedef std::vector<dynamic> dynamic_array;

// dynamic is a value whose structure is only known at run-time. It's the
// common form that keys and values pass through on their way to and from
// JSON text.
struct dynamic
{
    dynamic() : type_(value_type::NIL), value_(nil)
    {
    }
    dynamic(nil_t) : type_(value_type::NIL), value_(nil)
    {
    }
    dynamic(bool v) : type_(value_type::BOOLEAN), value_(v)
    {
    }
    dynamic(integer v) : type_(value_type::INTEGER), value_(v)
    {
    }
    dynamic(double v) : type_(value_type::FLOAT), value_(v)
    {
    }
    dynamic(string v) : type_(value_type::STRING), value_(std::move(v))
    {
    }
    dynamic(char const* v) : type_(value_type::STRING), value_(string(v))
    {
    }
    dynamic(dynamic_array const& v);
    dynamic(dynamic_array&& v);
    dynamic(dynamic_map const& v);
    dynamic(dynamic_map&& v);

    // A list of two-element lists that all start with strings is taken to be
    // a map. Any other list is an array.
    dynamic(std::initializer_list<dynamic> list);

    value_type
    type() const
    {
        return type_;
    }

    // Direct access to the stored value. cast<T>(v) is the checked way to get
    // at this.
    std::any const&
    contents() const&
    {
        return value_;
    }
    std::any&
    contents() &
    {
        return value_;
    }
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

    friend void
    swap(dynamic& a, dynamic& b)
    {
        std::swap(a.type_, b.type_);
        a.value_.swap(b.value_);
    }

 private:
    value_type type_;
    std::any value_;
};

// Dynamic values are ordered first by type and then by contents.
bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);
bool
operator<(dynamic const& a, dynamic const& b);

// dynamic_map is the dynamic form of a JSON object (or of any other map).
// Entries stay in the order they were added, and a key may appear more than
// once, so a map can describe any JSON object exactly as it was written.
// Lookups by key find the last entry with that key.
class dynamic_map
{
 public:
    typedef std::pair<dynamic, dynamic> entry;
    typedef std::vector<entry>::const_iterator const_iterator;
    typedef std::vector<entry>::iterator iterator;

    dynamic_map()
    {
    }
    dynamic_map(std::initializer_list<entry> entries) : entries_(entries)
    {
    }

    const_iterator
    begin() const
    {
        return entries_.begin();
    }
    const_iterator
    end() const
    {
        return entries_.end();
    }
    iterator
    begin()
    {
        return entries_.begin();
    }
    iterator
    end()
    {
        return entries_.end();
    }

    size_t
    size() const
    {
        return entries_.size();
    }
    bool
    empty() const
    {
        return entries_.empty();
    }

    void
    reserve(size_t n)
    {
        entries_.reserve(n);
    }

    // Add an entry at the end, even if :key is already present.
    void
    append(dynamic key, dynamic value)
    {
        entries_.emplace_back(std::move(key), std::move(value));
    }

    // Get the value of the last entry with :key (or null if there is none).
    dynamic const*
    find(dynamic const& key) const;
    dynamic*
    find(dynamic const& key);

    // Get the value of the last entry with :key, appending a nil entry for
    // :key if there isn't one.
    dynamic&
    operator[](dynamic const& key);

    friend bool
    operator==(dynamic_map const& a, dynamic_map const& b)
    {
        return a.entries_ == b.entries_;
    }
    friend bool
    operator!=(dynamic_map const& a, dynamic_map const& b)
    {
        return !(a == b);
    }
    friend bool
    operator<(dynamic_map const& a, dynamic_map const& b)
    {
        return a.entries_ < b.entries_;
    }

 private:
    std::vector<entry> entries_;
};

} // namespace anykey

#endif
