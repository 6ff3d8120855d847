#ifndef CACHET_REMOTE_SERVICE_HPP
#define CACHET_REMOTE_SERVICE_HPP

#include <cppcoro/task.hpp>

#include <cachet/core.h>

namespace cachet {

// A remote_request identifies a call to the remote data service: the name of
// the operation and its parameters.
struct remote_request
{
    string name;
    dynamic params;
};

bool
operator==(remote_request const& a, remote_request const& b);
bool
operator!=(remote_request const& a, remote_request const& b);

std::ostream&
operator<<(std::ostream& s, remote_request const& request);

// The remote call failed.
// This is the only kind of error that the cache passes through to its
// callers. Loaders and mutations are free to throw other exceptions, but
// transports should report their failures with this.
CACHET_DEFINE_EXCEPTION(remote_call_failure)
CACHET_DEFINE_ERROR_INFO(string, remote_call_name)
// This exception also provides internal_error_message_info.

// The remote call didn't complete within its time limit.
struct remote_call_timeout : remote_call_failure
{
};
CACHET_DEFINE_ERROR_INFO(integer, remote_call_timeout_ms)

// remote_service is the interface to the remote data service.
//
// Every call carries a time limit. Implementations must give up on a call
// once it's exceeded and fail with remote_call_timeout.
//
struct remote_service
{
    virtual ~remote_service()
    {
    }

    virtual cppcoro::task<dynamic>
    call(remote_request request, std::chrono::milliseconds timeout) = 0;
};

} // namespace cachet

#endif
