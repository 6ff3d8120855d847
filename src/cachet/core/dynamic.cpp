#include <cachet/core/dynamic.hpp>

#include <algorithm>

#include <cachet/core/utilities.hpp>
#include <cachet/encodings/json.hpp>

namespace cachet {

namespace {

char const*
value_type_name(value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            return "nil";
        case value_type::BOOLEAN:
            return "boolean";
        case value_type::INTEGER:
            return "integer";
        case value_type::FLOAT:
            return "float";
        case value_type::STRING:
            return "string";
        case value_type::ARRAY:
            return "array";
        case value_type::MAP:
            return "map";
    }
    CACHET_THROW(
        invalid_enum_value() << enum_id_info("value_type")
                             << enum_value_info(int(t)));
}

// Is :v a two-element array that starts with a string?
bool
is_named_pair(dynamic const& v)
{
    if (v.type() != value_type::ARRAY)
        return false;
    auto const& pair = cast<dynamic_array>(v);
    return pair.size() == 2 && pair.front().type() == value_type::STRING;
}

} // namespace

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    return s << value_type_name(t);
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        CACHET_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    if (list.size() == 0
        || !std::all_of(list.begin(), list.end(), is_named_pair))
    {
        *this = dynamic_array(list);
        return;
    }
    dynamic_map map;
    for (auto const& item : list)
    {
        auto const& pair = cast<dynamic_array>(item);
        map.insert_or_assign(pair[0], pair[1]);
    }
    *this = std::move(map);
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    return os << value_to_json(v);
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& path)
{
    return os << value_to_canonical_json(
               dynamic_array(path.begin(), path.end()));
}

size_t
deep_sizeof(dynamic_array const& x)
{
    size_t size = sizeof(dynamic_array);
    for (auto const& i : x)
        size += deep_sizeof(i);
    return size;
}

size_t
deep_sizeof(dynamic_map const& x)
{
    size_t size = sizeof(dynamic_map);
    for (auto const& i : x)
        size += deep_sizeof(i.first) + deep_sizeof(i.second);
    return size;
}

size_t
deep_sizeof(dynamic const& v)
{
    return sizeof(dynamic) + apply_to_dynamic(CACHET_LAMBDIFY(deep_sizeof), v);
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
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
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x < y; }, a, b);
}
bool
operator<=(dynamic const& a, dynamic const& b)
{
    return !(b < a);
}
bool
operator>(dynamic const& a, dynamic const& b)
{
    return b < a;
}
bool
operator>=(dynamic const& a, dynamic const& b)
{
    return !(a < b);
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto entry = r.find(dynamic(field));
    if (entry == r.end())
        return false;
    *v = &entry->second;
    return true;
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
        CACHET_THROW(missing_field() << field_name_info(field));
    return *v;
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    if (auto* path = get_error_info<dynamic_value_path_info>(e))
        path->push_front(path_element);
    else
        e << dynamic_value_path_info(std::list<dynamic>{path_element});
}

} // namespace cachet
