#include <cachet/sync/core.hpp>

#include <algorithm>
#include <exception>

#include <cppcoro/when_all_ready.hpp>

#include <spdlog/spdlog.h>

#include <cachet/caching/policy.hpp>
#include <cachet/caching/sqlite_blob_store.hpp>
#include <cachet/core/logging.hpp>
#include <cachet/remote/signature.hpp>
#include <cachet/sync/internals.h>

namespace cachet {

namespace {

typedef detail::sync_core_internals internals;

internals&
initialized(std::unique_ptr<internals> const& impl)
{
    if (!impl)
    {
        CACHET_THROW(
            internal_check_failed() << internal_error_message_info(
                "sync_core used before it was reset with a config"));
    }
    return *impl;
}

// All of the helpers below expect the caller to hold the core's mutex.

optional<dynamic>
look_up(internals& core, string const& key)
{
    auto value = core.store.get(key, core.clock());
    if (value)
        ++core.hits;
    else
        ++core.misses;
    return value;
}

void
record_evictions(internals& core, std::vector<string> const& evicted)
{
    for (auto const& key : evicted)
    {
        ++core.evictions;
        spdlog::get("cachet")->debug("evicted {}", key);
        if (core.policies.resolve(key).durable)
            core.persistence.remove(key);
    }
}

void
forget(internals& core, std::vector<string> const& removed)
{
    for (auto const& key : removed)
    {
        if (core.policies.resolve(key).durable)
            core.persistence.remove(key);
    }
}

// Record that the application explicitly removed :key. This overrides the
// rollback of any mutation of :key that's in flight.
void
note_removal(internals& core, string const& key)
{
    auto flight = core.mutations.find(key);
    if (flight != core.mutations.end())
        ++flight->second.removals;
}

// Record that the application explicitly removed the namespace :prefix.
void
note_namespace_removal(internals& core, string const& prefix)
{
    for (auto& [key, flight] : core.mutations)
    {
        if (key_matches_prefix(key, prefix))
            ++flight.removals;
    }
}

// Write a value that's known to reflect the remote state. Unlike
// speculative values, these are persisted.
void
write_confirmed(
    internals& core,
    string const& key,
    dynamic value,
    std::chrono::milliseconds ttl)
{
    auto now = core.clock();
    record_evictions(core, core.store.put(key, std::move(value), ttl, now));
    if (core.policies.resolve(key).durable)
    {
        // The entry is gone already if the namespace has no room at all.
        auto entry = core.store.peek(key, now);
        if (entry)
            core.persistence.save(key, *entry);
    }
}

size_t
invalidate_prefix(internals& core, string const& prefix)
{
    note_namespace_removal(core, prefix);
    auto removed = core.store.remove_matching(prefix);
    forget(core, removed);
    return removed.size();
}

// Put :key back the way it was before a failed mutation.
// :removed_in_flight says whether the key was explicitly removed while the
// mutation was in flight.
void
roll_back(
    internals& core,
    string const& key,
    optional<cache_entry> const& snapshot,
    optional<uint64_t> speculative_revision,
    bool removed_in_flight)
{
    if (removed_in_flight)
        return;
    if (snapshot)
    {
        // A speculative value that has since expired or been evicted is
        // replaced just the same. Only a newer write takes precedence over
        // the snapshot.
        auto current = core.store.revision_of(key);
        if (!current || current == speculative_revision)
            record_evictions(core, core.store.restore(key, *snapshot));
    }
    else
    {
        if (core.store.remove(key))
            forget(core, {key});
    }
}

// Register a mutation of :key as in flight and return the key's current
// removal count.
uint64_t
begin_mutation(internals& core, string const& key)
{
    auto& flight = core.mutations[key];
    ++flight.count;
    return flight.removals;
}

// Unregister a mutation of :key. Returns true if the key was explicitly
// removed since the mutation began (i.e., since the removal count was
// :removals_at_start).
bool
end_mutation(internals& core, string const& key, uint64_t removals_at_start)
{
    auto flight = core.mutations.find(key);
    bool removed = flight->second.removals != removals_at_start;
    if (--flight->second.count == 0)
        core.mutations.erase(flight);
    return removed;
}

void
save_durable_entries(internals& core)
{
    if (!core.persistence.is_enabled())
        return;
    std::vector<keyed_cache_entry> durable;
    for (auto& entry : core.store.live_entries(core.clock()))
    {
        if (core.policies.resolve(entry.key).durable)
            durable.push_back(std::move(entry));
    }
    core.persistence.save_all(durable);
    spdlog::get("cachet")->info(
        "saved {} durable cache entries", durable.size());
}

void
load_durable_entries(internals& core)
{
    if (!core.persistence.is_enabled())
        return;
    size_t loaded = 0;
    for (auto& [key, entry] : core.persistence.load_all(core.clock()))
    {
        if (core.policies.resolve(key).durable)
        {
            forget(core, core.store.restore(key, std::move(entry)));
            ++loaded;
        }
        else
        {
            // The namespace has stopped being durable since this was saved.
            core.persistence.remove(key);
        }
    }
    spdlog::get("cachet")->info("loaded {} persisted cache entries", loaded);
}

cppcoro::task<dynamic>
load_and_store(
    internals& core,
    string key,
    remote_operation loader,
    optional<std::chrono::milliseconds> ttl_override,
    std::chrono::milliseconds timeout)
{
    auto value = co_await core.timeouts.bound(
        "loading " + key,
        [loader, timeout]() { return loader(timeout); },
        timeout);
    {
        std::scoped_lock<std::mutex> lock(core.mutex);
        write_confirmed(
            core,
            key,
            value,
            ttl_override ? *ttl_override : core.policies.resolve(key).ttl);
    }
    co_return value;
}

enum class preload_outcome
{
    LOADED,
    SKIPPED,
    FAILED
};

cppcoro::task<preload_outcome>
preload_one(sync_core& core, preload_task task)
{
    if (core.get(task.key))
        co_return preload_outcome::SKIPPED;
    try
    {
        read_options options;
        options.skip_cache = true;
        co_await core.read(task.key, std::move(task.loader), options);
    }
    catch (std::exception& e)
    {
        spdlog::get("cachet")->warn(
            "failed to preload {}: {}", task.key, e.what());
        co_return preload_outcome::FAILED;
    }
    co_return preload_outcome::LOADED;
}

} // namespace

void
sync_core::reset()
{
    if (impl_)
    {
        std::scoped_lock<std::mutex> lock(impl_->mutex);
        save_durable_entries(*impl_);
    }
    impl_.reset();
}

void
sync_core::reset(
    sync_config const& config,
    std::unique_ptr<blob_store> blobs,
    clock_function clock)
{
    reset();

    initialize_logging(
        config.log_file ? some(file_path(*config.log_file)) : none);
    if (config.log_level)
        set_log_level(*config.log_level);

    if (!blobs && config.persistence)
    {
        try
        {
            blobs.reset(new sqlite_blob_store(*config.persistence));
        }
        catch (std::exception& e)
        {
            spdlog::get("cachet")->warn(
                "running without persistence: {}", e.what());
        }
    }

    impl_.reset(new detail::sync_core_internals(
        config, std::move(blobs), std::move(clock)));

    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    load_durable_entries(core);
    core.last_sweep = core.clock();
    core.last_snapshot = core.last_sweep;
}

sync_core::~sync_core()
{
    reset();
}

optional<dynamic>
sync_core::get(string const& key)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    return look_up(core, key);
}

void
sync_core::set(
    string const& key,
    dynamic value,
    optional<std::chrono::milliseconds> ttl)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    write_confirmed(
        core,
        key,
        std::move(value),
        ttl ? *ttl : core.policies.resolve(key).ttl);
}

bool
sync_core::remove(string const& key)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    note_removal(core, key);
    if (!core.store.remove(key))
        return false;
    forget(core, {key});
    return true;
}

void
sync_core::invalidate(std::vector<string> const& keys)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    for (auto const& key : keys)
    {
        note_removal(core, key);
        if (core.store.remove(key))
            forget(core, {key});
    }
}

size_t
sync_core::invalidate_namespace(string const& prefix)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    return invalidate_prefix(core, prefix);
}

void
sync_core::clear()
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    core.store.clear();
    for (auto& [key, flight] : core.mutations)
        ++flight.removals;
    core.persistence.remove_all();
}

std::vector<batch_get_result>
sync_core::batch_get(std::vector<string> const& keys)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    std::vector<batch_get_result> results;
    results.reserve(keys.size());
    for (auto const& key : keys)
        results.push_back(batch_get_result{key, look_up(core, key)});
    return results;
}

void
sync_core::batch_set(std::vector<batch_set_item> const& items)
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    for (auto const& item : items)
    {
        write_confirmed(
            core,
            item.key,
            item.value,
            item.ttl ? *item.ttl : core.policies.resolve(item.key).ttl);
    }
}

cppcoro::task<dynamic>
sync_core::read(string key, remote_operation loader, read_options options)
{
    auto& core = initialized(impl_);

    if (!options.skip_cache)
    {
        optional<dynamic> cached;
        {
            std::scoped_lock<std::mutex> lock(core.mutex);
            cached = look_up(core, key);
        }
        if (cached)
            co_return std::move(*cached);
    }

    auto timeout
        = options.timeout ? *options.timeout : core.config.default_timeout;
    co_return co_await core.coalescer.invoke(
        key,
        [&core,
         key,
         loader = std::move(loader),
         ttl_override = options.ttl_override,
         timeout]() {
            return load_and_store(core, key, loader, ttl_override, timeout);
        });
}

cppcoro::task<dynamic>
sync_core::mutate(
    string key,
    dynamic patch,
    remote_operation mutation,
    mutate_options options)
{
    auto& core = initialized(impl_);

    optional<cache_entry> snapshot;
    optional<uint64_t> speculative_revision;
    uint64_t removals_at_start;
    {
        std::scoped_lock<std::mutex> lock(core.mutex);
        auto now = core.clock();
        snapshot = core.store.peek(key, now);
        if (snapshot)
        {
            record_evictions(
                core,
                core.store.put(
                    key,
                    apply_patch(snapshot->value, patch),
                    options.speculative_ttl ? *options.speculative_ttl
                                            : core.config.speculative_ttl,
                    now));
            speculative_revision = core.store.revision_of(key);
        }
        removals_at_start = begin_mutation(core, key);
    }

    auto timeout
        = options.timeout ? *options.timeout : core.config.default_timeout;
    optional<dynamic> confirmed;
    std::exception_ptr failure;
    try
    {
        confirmed = co_await core.timeouts.bound(
            "mutating " + key,
            [mutation, timeout]() { return mutation(timeout); },
            timeout);
    }
    catch (...)
    {
        failure = std::current_exception();
    }

    if (failure)
    {
        {
            std::scoped_lock<std::mutex> lock(core.mutex);
            roll_back(
                core,
                key,
                snapshot,
                speculative_revision,
                end_mutation(core, key, removals_at_start));
        }
        spdlog::get("cachet")->warn("mutation of {} failed; rolled back", key);
        std::rethrow_exception(failure);
    }

    {
        std::scoped_lock<std::mutex> lock(core.mutex);
        end_mutation(core, key, removals_at_start);
        write_confirmed(
            core, key, *confirmed, core.policies.resolve(key).ttl);
        for (auto const& dependent : core.policies.dependents_of(key))
        {
            auto removed = invalidate_prefix(core, dependent);
            spdlog::get("cachet")->debug(
                "mutation of {} invalidated {} entries in {}",
                key,
                removed,
                dependent);
        }
    }
    co_return std::move(*confirmed);
}

cppcoro::task<dynamic>
sync_core::call(
    remote_service& service,
    remote_request request,
    optional<std::chrono::milliseconds> timeout)
{
    auto& core = initialized(impl_);
    auto signature = make_call_signature(request);
    auto limit = timeout ? *timeout : core.config.default_timeout;
    co_return co_await core.coalescer.invoke(
        signature,
        [&core, &service, signature, request = std::move(request), limit]() {
            return core.timeouts.bound(
                "calling " + signature,
                [&service, request, limit]() {
                    return service.call(request, limit);
                },
                limit);
        });
}

cppcoro::task<preload_summary>
sync_core::preload(std::vector<preload_task> tasks)
{
    initialized(impl_);
    std::stable_sort(
        tasks.begin(),
        tasks.end(),
        [](preload_task const& a, preload_task const& b) {
            return a.priority > b.priority;
        });

    std::vector<cppcoro::task<preload_outcome>> loads;
    loads.reserve(tasks.size());
    for (auto& task : tasks)
        loads.push_back(preload_one(*this, std::move(task)));

    auto settled = co_await cppcoro::when_all_ready(std::move(loads));

    preload_summary summary;
    for (auto& load : settled)
    {
        switch (load.result())
        {
            case preload_outcome::LOADED:
                ++summary.loaded;
                break;
            case preload_outcome::SKIPPED:
                ++summary.skipped;
                break;
            case preload_outcome::FAILED:
                ++summary.failed;
                break;
        }
    }
    co_return summary;
}

cache_stats
sync_core::get_stats() const
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);

    cache_stats stats;
    stats.hits = core.hits;
    stats.misses = core.misses;
    stats.total_requests = core.hits + core.misses;
    if (stats.total_requests > 0)
    {
        stats.hit_rate = 100. * double(stats.hits) / stats.total_requests;
        stats.miss_rate = 100. * double(stats.misses) / stats.total_requests;
    }
    stats.eviction_count = core.evictions;

    auto live = core.store.live_entries(core.clock());
    stats.size = integer(live.size());
    for (auto const& [key, entry] : live)
    {
        stats.memory_usage += integer(
            key.size() + deep_sizeof(entry.value) + sizeof(cache_entry));
    }

    std::sort(
        live.begin(),
        live.end(),
        [](keyed_cache_entry const& a, keyed_cache_entry const& b) {
            return a.entry.access_count != b.entry.access_count
                       ? a.entry.access_count > b.entry.access_count
                       : a.key < b.key;
        });
    auto top_count = std::min(
        live.size(), size_t(std::max(core.config.top_key_count, integer(0))));
    for (size_t i = 0; i != top_count; ++i)
    {
        stats.top_accessed_keys.push_back(
            key_access_count{live[i].key, live[i].entry.access_count});
    }

    return stats;
}

size_t
sync_core::sweep_expired()
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    auto now = core.clock();
    auto removed = core.store.sweep_expired(now);
    forget(core, removed);
    core.last_sweep = now;
    return removed.size();
}

void
sync_core::do_idle_processing()
{
    auto& core = initialized(impl_);
    bool sweep_due;
    {
        std::scoped_lock<std::mutex> lock(core.mutex);
        auto now = core.clock();
        sweep_due = now - core.last_sweep >= core.config.sweep_interval;
        if (core.config.snapshot_interval
            && now - core.last_snapshot >= *core.config.snapshot_interval)
        {
            save_durable_entries(core);
            core.last_snapshot = now;
        }
    }
    if (sweep_due)
    {
        auto removed = sweep_expired();
        if (removed != 0)
        {
            spdlog::get("cachet")->debug(
                "swept {} stale cache entries", removed);
        }
    }
}

void
sync_core::flush()
{
    auto& core = initialized(impl_);
    std::scoped_lock<std::mutex> lock(core.mutex);
    save_durable_entries(core);
    core.last_snapshot = core.clock();
}

remote_operation
make_remote_loader(remote_service& service, remote_request request)
{
    return [&service, request = std::move(request)](
               std::chrono::milliseconds timeout) {
        return service.call(request, timeout);
    };
}

} // namespace cachet
