#include <cachet/remote/timeouts.hpp>

#include <atomic>
#include <exception>

#include <cppcoro/async_manual_reset_event.hpp>
#include <cppcoro/cancellation_source.hpp>
#include <cppcoro/operation_cancelled.hpp>
#include <cppcoro/sync_wait.hpp>

#include <spdlog/spdlog.h>

#include <cachet/core/logging.hpp>

namespace cachet {

namespace {

// the shared state of a race between an operation and its timer
struct race
{
    // Whoever claims this first gets to decide the outcome.
    std::atomic<bool> settled = false;
    optional<dynamic> result;
    std::exception_ptr failure;
    cppcoro::async_manual_reset_event decided;
};

cppcoro::task<>
run_operation(std::shared_ptr<race> state, timed_operation operation)
{
    optional<dynamic> result;
    std::exception_ptr failure;
    try
    {
        result = co_await operation();
    }
    catch (...)
    {
        failure = std::current_exception();
    }
    if (!state->settled.exchange(true))
    {
        state->result = std::move(result);
        state->failure = failure;
        state->decided.set();
    }
}

cppcoro::task<>
run_timer(
    cppcoro::io_service& io,
    std::shared_ptr<race> state,
    cppcoro::cancellation_token cancellation,
    string name,
    std::chrono::milliseconds timeout,
    std::atomic<size_t>& abandoned_count)
{
    try
    {
        co_await io.schedule_after(timeout, cancellation);
    }
    catch (cppcoro::operation_cancelled&)
    {
        co_return;
    }
    if (!state->settled.exchange(true))
    {
        ++abandoned_count;
        spdlog::get("cachet")->warn(
            "{} timed out after {} ms", name, timeout.count());
        try
        {
            CACHET_THROW(
                remote_call_timeout()
                << remote_call_name_info(name)
                << remote_call_timeout_ms_info(integer(timeout.count())));
        }
        catch (remote_call_timeout&)
        {
            state->failure = std::current_exception();
        }
        state->decided.set();
    }
}

} // namespace

timeout_enforcer::timeout_enforcer()
    : timer_thread_([this] { io_.process_events(); })
{
    initialize_logging();
}

timeout_enforcer::~timeout_enforcer()
{
    // The timers of pending operations still need the event loop, so the
    // scope has to be joined before it's stopped.
    cppcoro::sync_wait(scope_.join());
    io_.stop();
    timer_thread_.join();
}

cppcoro::task<dynamic>
timeout_enforcer::bound(
    string name, timed_operation operation, std::chrono::milliseconds timeout)
{
    auto state = std::make_shared<race>();
    scope_.spawn(run_operation(state, std::move(operation)));

    // Operations that complete without suspending never need a timer.
    if (!state->decided.is_set())
    {
        cppcoro::cancellation_source cancellation;
        scope_.spawn(run_timer(
            io_,
            state,
            cancellation.token(),
            std::move(name),
            timeout,
            abandoned_count_));
        co_await state->decided;
        cancellation.request_cancellation();
    }

    if (state->failure)
        std::rethrow_exception(state->failure);
    co_return std::move(*state->result);
}

} // namespace cachet
