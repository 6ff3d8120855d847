#include <cachet/remote/mock_service.hpp>

#include <algorithm>

namespace cachet {

mock_remote_exchange
make_mock_response(remote_request request, dynamic response)
{
    return mock_remote_exchange{
        std::move(request), mock_remote_outcome::RESPOND, std::move(response)};
}

mock_remote_exchange
make_mock_failure(remote_request request)
{
    return mock_remote_exchange{
        std::move(request), mock_remote_outcome::FAIL, nil};
}

mock_remote_exchange
make_mock_timeout(remote_request request)
{
    return mock_remote_exchange{
        std::move(request), mock_remote_outcome::TIME_OUT, nil};
}

void
mock_remote_service::set_script(mock_remote_script script)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    script_ = std::move(script);
    in_order_ = true;
}

bool
mock_remote_service::is_complete() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return script_.empty();
}

bool
mock_remote_service::is_in_order() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return in_order_;
}

size_t
mock_remote_service::call_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return call_count_;
}

cppcoro::task<dynamic>
mock_remote_service::call(
    remote_request request, std::chrono::milliseconds timeout)
{
    mock_remote_exchange exchange;
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        ++call_count_;
        auto match = std::ranges::find_if(script_, [&](auto const& exchange) {
            return exchange.request == request;
        });
        if (match == script_.end())
        {
            CACHET_THROW(
                internal_check_failed() << internal_error_message_info(
                    "unrecognized mock remote request: " + request.name));
        }
        if (match != script_.begin())
            in_order_ = false;
        exchange = std::move(*match);
        script_.erase(match);
    }

    switch (exchange.outcome)
    {
        case mock_remote_outcome::RESPOND:
            co_return exchange.response;
        case mock_remote_outcome::FAIL:
            CACHET_THROW(
                remote_call_failure()
                << remote_call_name_info(request.name)
                << internal_error_message_info("scripted failure"));
        case mock_remote_outcome::TIME_OUT:
            CACHET_THROW(
                remote_call_timeout()
                << remote_call_name_info(request.name)
                << remote_call_timeout_ms_info(timeout.count()));
    }
    CACHET_THROW(
        internal_check_failed() << internal_error_message_info(
            "invalid mock remote outcome for " + request.name));
}

} // namespace cachet
