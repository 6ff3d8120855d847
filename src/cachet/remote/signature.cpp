#include <cachet/remote/signature.hpp>

#include <cachet/encodings/json.hpp>

namespace cachet {

string
make_call_signature(string const& name, dynamic const& params)
{
    return name + " " + value_to_canonical_json(params);
}

} // namespace cachet
