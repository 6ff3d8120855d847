#ifndef CACHET_REMOTE_SIGNATURE_HPP
#define CACHET_REMOTE_SIGNATURE_HPP

#include <cachet/remote/service.hpp>

namespace cachet {

// Get the signature that identifies a call for coalescing purposes.
// This combines the operation name with a canonical encoding of the
// parameters, so two calls with the same parameters produce the same
// signature regardless of the order in which those parameters were given.
string
make_call_signature(string const& name, dynamic const& params);

static inline string
make_call_signature(remote_request const& request)
{
    return make_call_signature(request.name, request.params);
}

} // namespace cachet

#endif
