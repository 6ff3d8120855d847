#ifndef CACHET_REMOTE_COALESCER_HPP
#define CACHET_REMOTE_COALESCER_HPP

#include <functional>
#include <mutex>
#include <unordered_map>

#include <cppcoro/shared_task.hpp>
#include <cppcoro/task.hpp>

#include <cachet/core.h>

namespace cachet {

// An operation that the coalescer can run: something that produces a task
// for a dynamic value.
typedef std::function<cppcoro::task<dynamic>()> coalescible_operation;

// A call_coalescer ensures that at most one instance of an operation is in
// flight for each signature. Callers that invoke a signature while it's
// already pending simply wait for the pending operation and receive its
// result (or its exception).
//
// A pending operation is forgotten as soon as it completes, before any of its
// callers are resumed, so a caller that invokes the same signature right
// after getting a result starts a fresh operation.
//
// The table of pending operations is protected by a mutex, so invoke() may be
// called from multiple threads.
//
struct call_coalescer : noncopyable
{
    // Get the result of :operation, or of the operation already pending for
    // :signature, if there is one. :operation is only called if there isn't.
    cppcoro::task<dynamic>
    invoke(string signature, coalescible_operation operation);

    // Is there an operation pending for :signature?
    bool
    is_pending(string const& signature) const;

    // the number of pending operations
    size_t
    pending_count() const;

    // the number of invocations that joined an already pending operation
    // (over the life of the coalescer)
    size_t
    joined_count() const;

 private:
    cppcoro::shared_task<dynamic>
    execute(string signature, coalescible_operation operation);

    mutable std::mutex mutex_;
    std::unordered_map<string, cppcoro::shared_task<dynamic>> pending_;
    size_t joined_count_ = 0;
};

} // namespace cachet

#endif
