#include <cachet/remote/coalescer.hpp>

#include <exception>

#include <spdlog/spdlog.h>

#include <cachet/core/logging.hpp>

namespace cachet {

cppcoro::shared_task<dynamic>
call_coalescer::execute(string signature, coalescible_operation operation)
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

    // The pending record has to go before anyone is resumed with the
    // outcome. (This task is still referenced by the caller that started it,
    // so it survives the erasure.)
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        pending_.erase(signature);
    }

    if (failure)
        std::rethrow_exception(failure);
    co_return std::move(*result);
}

cppcoro::task<dynamic>
call_coalescer::invoke(string signature, coalescible_operation operation)
{
    cppcoro::shared_task<dynamic> task;
    {
        std::scoped_lock<std::mutex> lock(mutex_);
        auto pending = pending_.find(signature);
        if (pending != pending_.end())
        {
            task = pending->second;
            ++joined_count_;
            initialize_logging();
            spdlog::get("cachet")->debug("joining pending call {}", signature);
        }
        else
        {
            task = execute(signature, std::move(operation));
            pending_.emplace(std::move(signature), task);
        }
    }
    co_return co_await task;
}

bool
call_coalescer::is_pending(string const& signature) const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return pending_.find(signature) != pending_.end();
}

size_t
call_coalescer::pending_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t
call_coalescer::joined_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return joined_count_;
}

} // namespace cachet
