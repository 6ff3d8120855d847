#ifndef CACHET_SYNC_CORE_HPP
#define CACHET_SYNC_CORE_HPP

#include <memory>

#include <cppcoro/task.hpp>

#include <cachet/caching/persistence.hpp>
#include <cachet/remote/service.hpp>
#include <cachet/sync/types.hpp>

namespace cachet {

namespace detail {

struct sync_core_internals;

}

// sync_core is the synchronization layer that sits between an application
// and its remote data service. It combines the in-memory entry store, the
// namespace policies, call coalescing and persistence of durable namespaces.
//
// A sync_core must be reset() with a configuration before it's used.
// Resetting or destroying an initialized core flushes its durable entries to
// the blob store.
//
// All operations may be invoked concurrently. The internal tables are
// protected by a mutex that's never held while a remote call is awaited.
//
struct sync_core : noncopyable
{
    sync_core()
    {
    }
    sync_core(sync_config const& config)
    {
        reset(config);
    }
    ~sync_core();

    void
    reset();

    // (Re)initialize the core with :config.
    //
    // If :blobs is given, it's used to persist durable namespaces.
    // Otherwise, if the config specifies persistence, a sqlite_blob_store is
    // opened for it. (If that fails, the core runs without persistence.)
    //
    // Entries previously persisted in durable namespaces are loaded.
    //
    // :clock supplies the current time.
    //
    void
    reset(
        sync_config const& config,
        std::unique_ptr<blob_store> blobs = nullptr,
        clock_function clock = system_clock_now);

    bool
    is_initialized() const
    {
        return impl_ ? true : false;
    }

    // LOCAL ACCESS

    // Get the cached value for :key, if it's live.
    optional<dynamic>
    get(string const& key);

    // Store :value under :key. If :ttl is omitted, the TTL of the key's
    // namespace is used.
    void
    set(string const& key,
        dynamic value,
        optional<std::chrono::milliseconds> ttl = none);

    // Remove the entry for :key. Returns false if there wasn't one.
    bool
    remove(string const& key);

    void
    invalidate(std::vector<string> const& keys);

    // Remove every entry in the namespace identified by :prefix (including
    // entries in longer namespaces nested within it).
    // Returns the number of entries removed.
    size_t
    invalidate_namespace(string const& prefix);

    // Remove everything, including all persisted entries.
    void
    clear();

    std::vector<batch_get_result>
    batch_get(std::vector<string> const& keys);

    void
    batch_set(std::vector<batch_set_item> const& items);

    // REMOTE ACCESS

    // Get the value for :key, from the cache if possible and otherwise via
    // :loader. Concurrent reads of the same key share a single load.
    // Errors from the loader propagate to every waiting caller.
    cppcoro::task<dynamic>
    read(string key, remote_operation loader, read_options options = {});

    // Apply :patch to the value for :key optimistically, then confirm it
    // with :mutation.
    //
    // If the key is cached, the patched value is visible immediately. If
    // :mutation succeeds, its result replaces the cached value and dependent
    // namespaces are invalidated. If it fails, the cache is put back the way
    // it was and the error is rethrown.
    //
    cppcoro::task<dynamic>
    mutate(
        string key,
        dynamic patch,
        remote_operation mutation,
        mutate_options options = {});

    // Issue :request to :service, sharing the call with any identical call
    // that's already in flight. The result isn't cached.
    cppcoro::task<dynamic>
    call(
        remote_service& service,
        remote_request request,
        optional<std::chrono::milliseconds> timeout = none);

    // Warm the cache with the results of :tasks. Keys that are already
    // cached are skipped. Failures are logged and counted but never thrown.
    cppcoro::task<preload_summary>
    preload(std::vector<preload_task> tasks);

    // MAINTENANCE

    cache_stats
    get_stats() const;

    // Remove all stale entries. Returns the number removed.
    size_t
    sweep_expired();

    // Do whatever periodic work is due: sweeping and snapshotting, as
    // scheduled by the configured intervals. This is intended to be called
    // regularly by the application.
    void
    do_idle_processing();

    // Save all live durable entries to the blob store (and drop anything
    // else it holds).
    void
    flush();

    detail::sync_core_internals&
    internals()
    {
        return *impl_;
    }

 private:
    std::unique_ptr<detail::sync_core_internals> impl_;
};

// Get a remote_operation that issues :request to :service.
// :service must outlive the returned operation.
remote_operation
make_remote_loader(remote_service& service, remote_request request);

} // namespace cachet

#endif
