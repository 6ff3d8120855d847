#ifndef CACHET_CORE_TYPE_DEFINITIONS_HPP
#define CACHET_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>

namespace cachet {

using std::string;

using boost::noncopyable;
using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cvref_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

inline bool
operator==(nil_t, nil_t)
{
    return true;
}
inline bool
operator!=(nil_t, nil_t)
{
    return false;
}
inline bool
operator<(nil_t, nil_t)
{
    return false;
}

// All times within cachet are measured on the system clock, since entry
// timestamps outlive the process when they're persisted.
typedef std::chrono::system_clock::time_point timestamp;

// A clock_function supplies the current time. The default is the system
// clock, but tests substitute a manual one.
typedef std::function<timestamp()> clock_function;

inline timestamp
system_clock_now()
{
    return std::chrono::system_clock::now();
}

struct dynamic;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
typedef std::map<dynamic, dynamic> dynamic_map;

// A dynamic holds any value that can be expressed as JSON (plus maps with
// non-string keys). Its contents are an std::any tagged with the value_type
// of what's inside.
struct dynamic
{
    // Default construction creates a nil value.
    dynamic() : type_(value_type::NIL)
    {
    }

    dynamic(nil_t) : type_(value_type::NIL)
    {
    }
    dynamic(bool v) : type_(value_type::BOOLEAN), value_(v)
    {
    }
    dynamic(integer v) : type_(value_type::INTEGER), value_(v)
    {
    }
    dynamic(int v) : type_(value_type::INTEGER), value_(integer(v))
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
    dynamic(dynamic_array v) : type_(value_type::ARRAY), value_(std::move(v))
    {
    }
    dynamic(dynamic_map v) : type_(value_type::MAP), value_(std::move(v))
    {
    }

    // A list of two-element arrays that all start with strings constructs a
    // map. Any other list constructs an array.
    dynamic(std::initializer_list<dynamic> list);

    value_type
    type() const
    {
        return type_;
    }

    // cast<T>(dynamic) is the checked way to get at these.
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

 private:
    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

} // namespace cachet

#endif
