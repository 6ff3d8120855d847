#ifndef CACHET_REMOTE_MOCK_SERVICE_HPP
#define CACHET_REMOTE_MOCK_SERVICE_HPP

#include <mutex>
#include <vector>

#include <cachet/remote/service.hpp>

namespace cachet {

// The outcome that a mock remote service delivers for a scripted request.
enum class mock_remote_outcome
{
    RESPOND,
    FAIL,
    TIME_OUT
};

struct mock_remote_exchange
{
    remote_request request;
    mock_remote_outcome outcome = mock_remote_outcome::RESPOND;
    // the response to deliver (only used for RESPOND)
    dynamic response;
};

// Make an exchange in which :request succeeds with :response.
mock_remote_exchange
make_mock_response(remote_request request, dynamic response);

// Make an exchange in which :request fails with a remote_call_failure.
mock_remote_exchange
make_mock_failure(remote_request request);

// Make an exchange in which :request fails with a remote_call_timeout.
mock_remote_exchange
make_mock_timeout(remote_request request);

typedef std::vector<mock_remote_exchange> mock_remote_script;

// mock_remote_service is a remote_service that follows a script of expected
// requests. Each scripted exchange is consumed by the first call that
// matches it. Calls that don't match any remaining exchange fail with
// internal_check_failed.
struct mock_remote_service : remote_service
{
    mock_remote_service()
    {
    }
    mock_remote_service(mock_remote_script script)
    {
        set_script(std::move(script));
    }

    // Set the script of expected exchanges.
    void
    set_script(mock_remote_script script);

    // Have all exchanges in the script been executed?
    bool
    is_complete() const;

    // Has the script been executed in order so far?
    bool
    is_in_order() const;

    // the number of calls that have been made
    size_t
    call_count() const;

    cppcoro::task<dynamic>
    call(remote_request request, std::chrono::milliseconds timeout) override;

 private:
    mutable std::mutex mutex_;
    mock_remote_script script_;
    bool in_order_ = true;
    size_t call_count_ = 0;
};

} // namespace cachet

#endif
