#ifndef CACHET_SYNC_INTERNALS_H
#define CACHET_SYNC_INTERNALS_H

#include <mutex>
#include <unordered_map>

#include <cachet/caching/entry_store.hpp>
#include <cachet/caching/persistence.hpp>
#include <cachet/remote/coalescer.hpp>
#include <cachet/remote/timeouts.hpp>
#include <cachet/sync/types.hpp>

namespace cachet {

namespace detail {

// the mutations of a single key that are currently awaiting confirmation
struct mutation_flight
{
    // how many mutations of the key are in flight
    int count = 0;
    // how many times the key has been explicitly removed while any of them
    // were in flight
    uint64_t removals = 0;
};

struct sync_core_internals : noncopyable
{
    sync_core_internals(
        sync_config const& config,
        std::unique_ptr<blob_store> blobs,
        clock_function clock)
        : config(config),
          clock(std::move(clock)),
          policies(
              config.namespaces ? *config.namespaces
                                : make_builtin_namespace_policies(),
              config.default_policy),
          store(policies),
          persistence(std::move(blobs))
    {
    }

    sync_config config;

    clock_function clock;

    namespace_policy_table policies;

    // protects :store, :mutations, the counters and the maintenance
    // timestamps
    std::mutex mutex;

    entry_store store;

    call_coalescer coalescer;

    timeout_enforcer timeouts;

    std::unordered_map<string, mutation_flight> mutations;

    persistence_adapter persistence;

    integer hits = 0;
    integer misses = 0;
    integer evictions = 0;

    timestamp last_sweep;
    timestamp last_snapshot;
};

} // namespace detail

} // namespace cachet

#endif
