#ifndef CACHET_SYNC_TYPES_HPP
#define CACHET_SYNC_TYPES_HPP

#include <functional>

#include <cppcoro/task.hpp>

#include <cachet/caching/policy.hpp>
#include <cachet/caching/sqlite_blob_store.hpp>

namespace cachet {

// A remote_operation performs one round-trip to the remote data service.
// It receives the time limit that applies to the call.
typedef std::function<cppcoro::task<dynamic>(std::chrono::milliseconds)>
    remote_operation;

struct read_options
{
    // Go straight to the remote service, even if the value is cached.
    // The fresh value still replaces the cached one.
    bool skip_cache = false;

    // the TTL to store the loaded value with - The default is the TTL of
    // the key's namespace.
    optional<std::chrono::milliseconds> ttl_override;

    // the time limit for the remote call - The default is the configured
    // default timeout.
    optional<std::chrono::milliseconds> timeout;
};

struct mutate_options
{
    optional<std::chrono::milliseconds> timeout;

    // how long the speculative value lives if nothing replaces it - The
    // default is the configured speculative TTL.
    optional<std::chrono::milliseconds> speculative_ttl;
};

// a request to warm the cache with the value for :key
struct preload_task
{
    string key;
    remote_operation loader;
    // Higher priorities are started first.
    integer priority = 0;
};

struct preload_summary
{
    // how many keys were loaded from the remote service
    size_t loaded = 0;
    // how many keys were already cached
    size_t skipped = 0;
    // how many loaders failed
    size_t failed = 0;
};

bool
operator==(preload_summary const& a, preload_summary const& b);
bool
operator!=(preload_summary const& a, preload_summary const& b);

std::ostream&
operator<<(std::ostream& s, preload_summary const& summary);

struct batch_get_result
{
    string key;
    optional<dynamic> value;
};

struct batch_set_item
{
    string key;
    dynamic value;
    // The default is the TTL of the key's namespace.
    optional<std::chrono::milliseconds> ttl;
};

struct key_access_count
{
    string key;
    integer access_count;
};

bool
operator==(key_access_count const& a, key_access_count const& b);

struct cache_stats
{
    integer hits = 0;
    integer misses = 0;
    integer total_requests = 0;

    // hits and misses as percentages of all requests (0 if there haven't
    // been any)
    double hit_rate = 0;
    double miss_rate = 0;

    // the number of entries that have been evicted to keep namespaces within
    // their size limits
    integer eviction_count = 0;

    // the number of live entries
    integer size = 0;

    // an estimate of the memory used by the live entries (in bytes)
    integer memory_usage = 0;

    // the most frequently accessed keys, most accessed first
    std::vector<key_access_count> top_accessed_keys;
};

struct sync_config
{
    // the namespace table - If this is omitted, the built-in table is used.
    optional<std::vector<namespace_policy>> namespaces;

    // the policy for keys outside all namespaces
    namespace_policy default_policy = make_default_namespace_policy();

    // the time limit for remote calls that don't specify their own
    std::chrono::milliseconds default_timeout{10000};

    // the TTL of values written speculatively by mutate()
    std::chrono::milliseconds speculative_ttl{5000};

    // how often do_idle_processing() sweeps out stale entries
    std::chrono::milliseconds sweep_interval{60000};

    // how often do_idle_processing() snapshots durable entries to the blob
    // store - If this is omitted, snapshots are only taken on flush().
    optional<std::chrono::milliseconds> snapshot_interval;

    // how many keys cache_stats::top_accessed_keys holds
    integer top_key_count = 10;

    // where durable entries are kept - If this is omitted, nothing is
    // persisted.
    optional<sqlite_blob_store_config> persistence;

    // the level for the "cachet" logger ("debug", "info", etc.)
    optional<string> log_level;

    // a file to write log messages to, in addition to the console
    optional<string> log_file;
};

// Apply :patch to :value.
// If both are maps, this is a shallow merge: fields in :patch replace the
// corresponding fields in :value. Otherwise, :patch replaces :value.
dynamic
apply_patch(dynamic const& value, dynamic const& patch);

} // namespace cachet

#endif
