#include <cachet/remote/service.hpp>

#include <cachet/encodings/json.hpp>

namespace cachet {

bool
operator==(remote_request const& a, remote_request const& b)
{
    return a.name == b.name && a.params == b.params;
}
bool
operator!=(remote_request const& a, remote_request const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, remote_request const& request)
{
    s << request.name << " " << value_to_canonical_json(request.params);
    return s;
}

} // namespace cachet
