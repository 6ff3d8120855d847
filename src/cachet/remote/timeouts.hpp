#ifndef CACHET_REMOTE_TIMEOUTS_HPP
#define CACHET_REMOTE_TIMEOUTS_HPP

#include <atomic>
#include <functional>
#include <thread>

#include <cppcoro/async_scope.hpp>
#include <cppcoro/io_service.hpp>
#include <cppcoro/task.hpp>

#include <cachet/remote/service.hpp>

namespace cachet {

// an operation whose completion is bounded by a timeout_enforcer
typedef std::function<cppcoro::task<dynamic>()> timed_operation;

// A timeout_enforcer puts a hard limit on how long callers wait for remote
// operations, whether or not the operations themselves honor their time
// limits.
//
// Each bounded operation is raced against a timer. If the timer wins, the
// caller gets a remote_call_timeout and the operation is abandoned: it keeps
// running in the background and its eventual outcome is discarded.
//
// The enforcer runs its timers on a thread of its own. Callers that are
// released by a timer are resumed on that thread.
//
// Destroying the enforcer waits for any abandoned operations to finish.
//
struct timeout_enforcer : noncopyable
{
    timeout_enforcer();
    ~timeout_enforcer();

    // Get the result of :operation, or fail with remote_call_timeout if it
    // doesn't settle within :timeout. :name identifies the operation in the
    // exception.
    cppcoro::task<dynamic>
    bound(
        string name,
        timed_operation operation,
        std::chrono::milliseconds timeout);

    // the number of operations that have been abandoned because they timed
    // out (over the life of the enforcer)
    size_t
    abandoned_count() const
    {
        return abandoned_count_;
    }

 private:
    cppcoro::io_service io_;
    cppcoro::async_scope scope_;
    std::atomic<size_t> abandoned_count_ = 0;
    std::thread timer_thread_;
};

} // namespace cachet

#endif
